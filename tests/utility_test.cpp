#include <rapidcheck.h>
#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "_utility.hpp"

namespace fp = fpds;

RC_GTEST_PROP(Utility, ShowIterator, (std::vector<int> xs)) {
	std::ostringstream out1, out2;
	out1 << fp::ShowIterator(xs.begin(), xs.end(), "[", "]", ", ");
	rc::show(xs, out2);
	RC_ASSERT(out1.str() == out2.str());
}

RC_GTEST_PROP(Utility, less_iterator, (std::vector<int> xs, std::vector<int> ys)) {
	RC_ASSERT(fp::less_iterator(xs.begin(), xs.end(), ys.begin(), ys.end()) == (xs < ys));
}

RC_GTEST_PROP(Utility, HashIterable, (std::vector<int> xs)) {
	fp::HashIterable<std::vector<int>> hash;
	RC_ASSERT(hash(xs) == hash(std::vector<int>(xs)));
}

RC_GTEST_PROP(Utility, overloaded, (int x)) {
	std::variant<int, std::string> value = x;
	auto describe = fp::overloaded {
		[](int n) { return std::string("int ") + std::to_string(n); },
		[](const std::string& s) { return "string " + s; },
	};
	RC_ASSERT(std::visit(describe, value) == "int " + std::to_string(x));
	value = std::to_string(x);
	RC_ASSERT(std::visit(describe, value) == "string " + std::to_string(x));
}

TEST(Utility_Example, EmptyStructureError) {
	try {
		throw fp::EmptyStructureError("head of empty sequence");
	} catch(const std::out_of_range& error) {
		EXPECT_EQ(std::string(error.what()), "head of empty sequence");
	}
	EXPECT_THROW(throw fp::EmptyStructureError(std::string("init")), std::logic_error);
}
