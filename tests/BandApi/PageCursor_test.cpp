/*
 * OpenBand - Tests
 * Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <PageCursor.hpp>

using namespace OpenBand;
using namespace OpenBand::BandApi;

TEST(PageCursorTest, FromResultData_KeepsKeyOrderAndStringifiesValues)
{
	const auto cursor = PageCursor::fromResultData(Json::parse(
		R"({"items":[],"paging":{"previous_params":null,"next_params":{"band_key":"AAA","limit":20,"after":"123"}}})"));

	ASSERT_TRUE(cursor.has_value());
	const QueryParams expected{{"band_key", "AAA"}, {"limit", "20"}, {"after", "123"}};
	EXPECT_EQ(cursor->params, expected);
}

TEST(PageCursorTest, FromResultData_AbsentOrNull)
{
	EXPECT_FALSE(PageCursor::fromResultData(Json::parse(R"({"items":[]})")).has_value());
	EXPECT_FALSE(PageCursor::fromResultData(Json::parse(R"({"paging":null})")).has_value());
	EXPECT_FALSE(PageCursor::fromResultData(Json::parse(R"({"paging":{"next_params":null}})")).has_value());
}

TEST(PageCursorTest, ApplyTo_ReplacesExistingAndAppendsNew)
{
	const PageCursor cursor{{{"band_key", "AAA"}, {"after", "123"}}};
	QueryParams query{{"access_token", "T"}, {"band_key", "OLD"}, {"locale", "ko_KR"}};

	cursor.applyTo(query);

	const QueryParams expected{{"access_token", "T"}, {"band_key", "AAA"}, {"locale", "ko_KR"}, {"after", "123"}};
	EXPECT_EQ(query, expected);
}
