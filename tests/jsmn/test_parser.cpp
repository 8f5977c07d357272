#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include<assert.h>

int main() {
	Jsmn::Parser p;
	assert(p.empty());

	/* A reply split across reads.  */
	{
		auto res = p.feed(R"JSON({"jsonrpc": "2.0", "id": 1, "res)JSON");
		assert(res.size() == 0);
		assert(!p.empty());
	}
	{
		auto res = p.feed(R"JSON(ult": {"channels": []}})JSON");
		assert(res.size() == 1);
		assert(res[0].is_object());
		assert(double(res[0]["id"]) == 1);
		assert(res[0]["result"]["channels"].is_array());
		assert(res[0]["result"]["channels"].size() == 0);
		assert(p.empty());
	}

	/* Several replies in one read.  */
	{
		auto res = p.feed("{\"id\": 2}\n{\"id\": 3}\n[1, 2]");
		assert(res.size() == 3);
		assert(double(res[0]["id"]) == 2);
		assert(double(res[1]["id"]) == 3);
		assert(res[2].is_array());
	}

	/* Braces and quotes inside strings do not count.  */
	{
		auto res = p.feed(R"JSON({"message": "bad } \" ]"})JSON");
		assert(res.size() == 1);
		assert(std::string(res[0]["message"]) == "bad } \" ]");
	}
	{
		auto res = p.feed(R"JSON({"s": "\\)JSON");
		assert(res.size() == 0);
		res = p.feed(R"JSON("})JSON");
		assert(res.size() == 1);
		assert(std::string(res[0]["s"]) == "\\");
	}

	/* Top-level numbers end at a delimiter.  */
	{
		auto res = p.feed(" 42");
		assert(res.size() == 0);
		res = p.feed("\n");
		assert(res.size() == 1);
		assert(res[0].is_number());
		assert(double(res[0]) == 42);
	}

	/* Bad input is reported.  */
	{
		auto flag = false;
		try {
			auto q = Jsmn::Parser();
			q.feed("{\"a\" 1}");
		} catch (Jsmn::ParseError const&) {
			flag = true;
		}
		assert(flag);
	}
	{
		auto flag = false;
		try {
			Jsmn::Parser::parse_datum("{} {}");
		} catch (Jsmn::ParseError const&) {
			flag = true;
		}
		assert(flag);
	}

	return 0;
}
