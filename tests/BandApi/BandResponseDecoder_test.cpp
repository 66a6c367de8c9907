/*
 * OpenBand - Tests
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <BandError.hpp>
#include <BandResponseDecoder.hpp>
#include <NullLogger.hpp>

#include <TestFakes.hpp>

using namespace OpenBand;
using namespace OpenBand::BandApi;
using OpenBand::Testing::jsonResponse;

class BandResponseDecoderTest : public ::testing::Test {
protected:
	BandResponseDecoder decoder{Logger::NullLogger::instance()};
};

TEST_F(BandResponseDecoderTest, Parse_SuccessReturnsBodyUnchanged)
{
	const Json j = decoder.parse(jsonResponse(200, R"({"result_code":1,"result_data":{"b":1,"a":2}})"));

	EXPECT_EQ(j["result_code"], 1);
	auto it = j["result_data"].begin();
	EXPECT_EQ(it.key(), "b");
	EXPECT_EQ((++it).key(), "a");
}

TEST_F(BandResponseDecoderTest, Parse_ErrorEnvelopeComposesMessage)
{
	const std::string body =
		R"({"result_code":60102,"result_data":{"message":"Invalid member","detail":{"error":"not_member","description":"Not a member of the band"}}})";

	try {
		decoder.parse(jsonResponse(400, body));
		FAIL() << "ApiError expected";
	} catch (const ApiError &e) {
		EXPECT_STREQ(e.what(), "60102, Invalid member(not_member)\nNot a member of the band");
		EXPECT_EQ(e.resultCode(), 60102);
		EXPECT_EQ(e.message(), "Invalid member");
		EXPECT_EQ(e.error(), "not_member");
		EXPECT_EQ(e.description(), "Not a member of the band");
		EXPECT_EQ(e.httpStatus(), 400);
	}
}

TEST_F(BandResponseDecoderTest, Parse_ErrorWithEmptyBodyUsesDefaults)
{
	try {
		decoder.parse(jsonResponse(500, ""));
		FAIL() << "ApiError expected";
	} catch (const ApiError &e) {
		EXPECT_STREQ(e.what(), "-1, ()\n");
		EXPECT_EQ(e.resultCode(), -1);
		EXPECT_EQ(e.httpStatus(), 500);
	}
}

TEST_F(BandResponseDecoderTest, Parse_ErrorWithMalformedBodyUsesDefaults)
{
	EXPECT_THROW(decoder.parse(jsonResponse(502, "{not json")), ApiError);
}

TEST_F(BandResponseDecoderTest, Parse_ErrorWithHtmlBodyIgnoresBody)
{
	HttpResponse response;
	response.status = 503;
	response.headers["content-type"] = "text/html";
	response.body = R"({"result_code":7})";

	try {
		decoder.parse(response);
		FAIL() << "ApiError expected";
	} catch (const ApiError &e) {
		EXPECT_EQ(e.resultCode(), -1);
	}
}

TEST_F(BandResponseDecoderTest, Parse_SuccessWithoutJsonContentType)
{
	HttpResponse response;
	response.status = 200;
	response.headers["content-type"] = "text/plain";
	response.body = "{}";

	try {
		decoder.parse(response);
		FAIL() << "ApiError expected";
	} catch (const ApiError &e) {
		EXPECT_STREQ(e.what(), "invalid content type");
	}
}

TEST_F(BandResponseDecoderTest, Parse_SuccessWithMalformedBody)
{
	try {
		decoder.parse(jsonResponse(200, "{\"result_code\":"));
		FAIL() << "ApiError expected";
	} catch (const ApiError &e) {
		EXPECT_STREQ(e.what(), "malformed response body");
	}
}

TEST_F(BandResponseDecoderTest, UnwrapEnvelope_ReturnsResultData)
{
	const Json resultData = decoder.unwrapEnvelope(Json::parse(R"({"result_code":1,"result_data":{"x":"y"}})"));
	EXPECT_EQ(resultData["x"], "y");
}

TEST_F(BandResponseDecoderTest, UnwrapEnvelope_NullResultDataIsEmptyObject)
{
	const Json resultData = decoder.unwrapEnvelope(Json::parse(R"({"result_code":1,"result_data":null})"));
	EXPECT_TRUE(resultData.is_object());
	EXPECT_TRUE(resultData.empty());
}

TEST_F(BandResponseDecoderTest, UnwrapEnvelope_FailureCodeThrows)
{
	try {
		decoder.unwrapEnvelope(
			Json::parse(R"({"result_code":211,"result_data":{"message":"Invalid parameter"}})"));
		FAIL() << "ApiError expected";
	} catch (const ApiError &e) {
		EXPECT_EQ(e.resultCode(), 211);
		EXPECT_EQ(e.message(), "Invalid parameter");
		EXPECT_EQ(e.httpStatus(), 200);
	}
}

TEST_F(BandResponseDecoderTest, UnwrapEnvelope_MissingOrNonIntegerCodeThrows)
{
	EXPECT_THROW(decoder.unwrapEnvelope(Json::parse(R"({"result_data":{}})")), ApiError);
	EXPECT_THROW(decoder.unwrapEnvelope(Json::parse(R"({"result_code":"1"})")), ApiError);
	EXPECT_THROW(decoder.unwrapEnvelope(Json::parse(R"([1])")), ApiError);
}

TEST_F(BandResponseDecoderTest, UnwrapEnvelope_CodeBeyondIntRangeIsNotSuccess)
{
	// 4294967297 == 2^32 + 1 truncates to 1 in a 32-bit int.
	try {
		decoder.unwrapEnvelope(Json::parse(R"({"result_code":4294967297,"result_data":{}})"));
		FAIL() << "ApiError expected";
	} catch (const ApiError &e) {
		EXPECT_EQ(e.resultCode(), 4294967297LL);
	}
}
