#pragma once

#include <functional>
#include <iterator>
#include <utility>
#include <cstdlib>
#include <iostream>
#include <string>
#include <stdexcept>

namespace fpds {

// Raised by operations that need at least one element.
struct EmptyStructureError : public std::out_of_range {
	explicit EmptyStructureError(const std::string& what)
		: std::out_of_range(what) { }
	explicit EmptyStructureError(const char* what)
		: std::out_of_range(what) { }
};

template<typename Container>
inline size_t hash_combine(size_t seed, const Container& value) {
	return std::hash<Container>{}(value) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

template<typename Container>
struct HashIterable {
	size_t operator () (const Container& xs) const {
		size_t seed = 0x9e3779b9;
		for(auto& x: xs) seed = fpds::hash_combine(seed, x);
		return seed;
	}
};

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

template<typename Iterator>
struct ShowIterator {
	Iterator left;
	Iterator right;
	std::string open;
	std::string close;
	std::string sep;

	ShowIterator(const Iterator& left, const Iterator& right,
		const std::string& open, const std::string& close, const std::string& sep)
		: left(left), right(right), open(open), close(close), sep(sep) { }

	friend std::ostream& operator <<(std::ostream& out, const ShowIterator& conf) {
		Iterator iter(conf.left);
		if(iter == conf.right) return out << conf.open << conf.close;
		out << conf.open << *iter;
		while(++iter != conf.right)
			out << conf.sep << *iter;
		out << conf.close;
		return out;
	}
};

template<typename Iterator1, typename Iterator2, typename Compare=
	std::less<typename std::iterator_traits<Iterator1>::value_type>>
constexpr bool less_iterator(
	Iterator1 xs, const Iterator1& xl,
	Iterator2 ys, const Iterator2& yl
) {
	while((xs != xl) && (ys != yl)) {
		if(Compare{}(*xs, *ys)) return true;
		if(Compare{}(*ys, *xs)) return false;
		++xs; ++ys;
	}
	return ys != yl;
}

}
