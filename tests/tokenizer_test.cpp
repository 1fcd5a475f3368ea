#include <catch2/catch.hpp>

#include <utilities/tokenizer.h>

TEST_CASE("Tokenizer splits on delimiters", "[tokenizer]") {
	std::vector<std::string> fields;

	tokenize("a b\tc", fields);
	REQUIRE(fields.size() == 3);
	REQUIRE(fields[2] == "c");

	tokenize("a,,b", fields, ",", false);
	REQUIRE(fields.size() == 2);

	tokenize("a,,b,", fields, ",", true);
	REQUIRE(fields.size() == 4);
	REQUIRE(fields[1] == "");
	REQUIRE(fields[3] == "");

	tokenize("", fields, ",", true);
	REQUIRE(fields.empty());
}

TEST_CASE("Tokenizer keeps quoted sections whole", "[tokenizer]") {
	std::vector<std::string> fields;

	tokenize("b1,0.9,\"POLYGON ((0 0, 1 0, 1 1, 0 0))\"", fields, ",", true, "\"");
	REQUIRE(fields.size() == 3);
	REQUIRE(fields[2] == "POLYGON ((0 0, 1 0, 1 1, 0 0))");

	tokenize("\"say \"\"hi\"\"\",x", fields, ",", true, "\"");
	REQUIRE(fields.size() == 2);
	REQUIRE(fields[0] == "say \"hi\"");

	tokenize("a,\"\"", fields, ",", true, "\"");
	REQUIRE(fields.size() == 2);
	REQUIRE(fields[1] == "");
}
