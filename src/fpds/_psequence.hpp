#pragma once

#include <iterator>
#include <memory>
#include <variant>
#include <sstream>
#include <cstddef>
#include <functional>
#include <type_traits>
#include <initializer_list>
#include <stdexcept>
#include <string>

#include "_utility.hpp"

namespace fpds {

template<typename Value, typename Allocator=std::allocator<Value>>
struct Sequence {
	struct Empty {
		constexpr bool operator ==(const Empty&) const
			{ return true; }
	};

	struct Node;
	struct Builder;

	using NodePtr = std::shared_ptr<const Node>;
	using Variant = std::variant<Empty, NodePtr>;

	template<typename Other>
	using Rebind = Sequence<Other,
		typename std::allocator_traits<Allocator>::template rebind_alloc<Other>>;

	template<typename Func>
	using Mapped = Rebind<std::decay_t<std::invoke_result_t<const Func&, const Value&>>>;

	struct Node {
		Value head;
		Sequence tail;

		template<typename ...Args>
		static inline std::shared_ptr<Node> make(Args&&... args) {
			return std::allocate_shared<Node>
				(Allocator{}, std::forward<Args>(args)...);
		}

		Node(const Value& head, const Sequence& tail)
			: head(head), tail(tail) { }
	};

	// Appends to the end of a chain that is not yet reachable from any other
	// sequence. The chain is published by build().
	struct Builder {
		Sequence result;
		Variant* last;

		Builder() : result(), last(&result.node) { }
		Builder(const Builder&) = delete;
		Builder& operator =(const Builder&) = delete;

		void push_back(const Value& value) {
			auto node = Node::make(value, Sequence());
			*this->last = NodePtr(node);
			this->last = &node->tail.node;
		}

		Sequence build() {
			Sequence built = this->result;
			this->result = Sequence();
			this->last = &this->result.node;
			return built;
		}
	};

	Variant node;

	Sequence() : node(Empty{}) { }
	Sequence(const Sequence&) = default;
	explicit Sequence(const NodePtr& node) : node(node) { }
	Sequence(const Value& head, const Sequence& tail)
		: node(NodePtr(Node::make(head, tail))) { }
	Sequence(std::initializer_list<Value> xs)
		: Sequence(xs.begin(), xs.end()) { }

	template<typename Iterator>
	Sequence(Iterator left, const Iterator& right) : node(Empty{}) {
		Builder builder;
		while(left != right) {
			builder.push_back(*left);
			++left;
		}
		this->node = builder.build().node;
	}

	// Unlinks uniquely owned nodes one at a time, so that releasing a long
	// chain does not recurse once per element.
	~Sequence() {
		auto first = std::get_if<NodePtr>(&this->node);
		if(!first) return;
		NodePtr next = std::move(*first);
		while(next && next.use_count() == 1) {
			auto tail = std::get_if<NodePtr>(&next->tail.node);
			if(!tail) break;
			NodePtr rest = std::move(const_cast<NodePtr&>(*tail));
			next = std::move(rest);
		}
	}

	inline Sequence& operator =(const Sequence& that) noexcept
		{ this->node = that.node; return *this; }

	constexpr bool empty() const
		{ return std::holds_alternative<Empty>(this->node); }
	explicit constexpr operator bool() const
		{ return !this->empty(); }

	constexpr const Value& head() const {
		return std::visit(overloaded {
			[](const Empty& _) -> const Value&
				{ throw EmptyStructureError("head of empty sequence"); },
			[](const NodePtr& node) -> const Value&
				{ return node->head; },
		}, this->node);
	}

	// The tail of the empty sequence is the empty sequence.
	constexpr Sequence tail() const {
		return std::visit(overloaded {
			[](const Empty& _) -> Sequence { return Sequence(); },
			[](const NodePtr& node) -> Sequence { return node->tail; },
		}, this->node);
	}

	constexpr Sequence set_head(const Value& value) const {
		return std::visit(overloaded {
			[](const Empty& _) -> Sequence
				{ throw EmptyStructureError("set_head of empty sequence"); },
			[&](const NodePtr& node) -> Sequence
				{ return Sequence(value, node->tail); },
		}, this->node);
	}

	// Recursion depth equals the length of the sequence.
	template<typename Result, typename Func>
	constexpr Result fold_right(const Result& init, const Func& func) const {
		return std::visit(overloaded {
			[&](const Empty& _) -> Result { return init; },
			[&](const NodePtr& node) -> Result
				{ return func(node->head, node->tail.fold_right(init, func)); },
		}, this->node);
	}

	template<typename Result, typename Func>
	constexpr Result fold_left(Result init, const Func& func) const {
		for(auto xs = std::get_if<NodePtr>(&this->node); xs;
				xs = std::get_if<NodePtr>(&(*xs)->tail.node))
			init = func(std::move(init), (*xs)->head);
		return init;
	}

	template<typename Result, typename Func>
	constexpr Result fold_right_via_fold_left(const Result& init, const Func& func) const {
		return this->reverse().fold_left(init,
			[&](const Result& acc, const Value& value) -> Result
				{ return func(value, acc); });
	}

	constexpr size_t size() const {
		return this->fold_left(size_t(0),
			[](size_t count, const Value& _) { return count + 1; });
	}

	constexpr size_t size_via_fold_right() const {
		return this->fold_right(size_t(0),
			[](const Value& _, size_t count) { return count + 1; });
	}

	constexpr Sequence reverse() const {
		return this->fold_left(Sequence(),
			[](const Sequence& acc, const Value& value) { return Sequence(value, acc); });
	}

	// Shares that; only the nodes of this are copied.
	constexpr Sequence append(const Sequence& that) const {
		return this->fold_right_via_fold_left(that,
			[](const Value& value, const Sequence& acc) { return Sequence(value, acc); });
	}

	template<typename Func>
	constexpr Mapped<Func> transform(const Func& func) const {
		using Result = Mapped<Func>;
		return this->fold_right_via_fold_left(Result(),
			[&](const Value& value, const Result& acc) { return Result(func(value), acc); });
	}

	template<typename Pred>
	constexpr Sequence filter(const Pred& pred) const {
		return this->fold_right_via_fold_left(Sequence(),
			[&](const Value& value, const Sequence& acc)
				{ return pred(value) ? Sequence(value, acc) : acc; });
	}

	template<typename Func>
	constexpr auto flat_map(const Func& func) const
		{ return concat(this->transform(func)); }

	template<typename Pred>
	constexpr Sequence filter_via_flat_map(const Pred& pred) const {
		return this->flat_map([&](const Value& value)
			{ return pred(value) ? Sequence(value, Sequence()) : Sequence(); });
	}

	constexpr Sequence drop(std::ptrdiff_t count) const {
		Sequence rest = *this;
		for(; count > 0 && !rest.empty(); --count)
			rest = rest.tail();
		return rest;
	}

	template<typename Pred>
	constexpr Sequence drop_while(const Pred& pred) const {
		Sequence rest = *this;
		while(!rest.empty() && pred(rest.head()))
			rest = rest.tail();
		return rest;
	}

	constexpr Sequence init() const {
		auto xs = std::get_if<NodePtr>(&this->node);
		if(!xs) throw EmptyStructureError("init of empty sequence");
		Builder builder;
		for(auto next = std::get_if<NodePtr>(&(*xs)->tail.node); next;
				xs = next, next = std::get_if<NodePtr>(&(*next)->tail.node))
			builder.push_back((*xs)->head);
		return builder.build();
	}

	template<typename Other, typename OtherAllocator, typename Func>
	constexpr Rebind<std::decay_t<std::invoke_result_t<const Func&, const Value&, const Other&>>>
	zip_with(const Sequence<Other, OtherAllocator>& that, const Func& func) const {
		using Result = Rebind<std::decay_t<std::invoke_result_t<const Func&, const Value&, const Other&>>>;
		using OtherPtr = typename Sequence<Other, OtherAllocator>::NodePtr;
		typename Result::Builder builder;
		auto xs = std::get_if<NodePtr>(&this->node);
		auto ys = std::get_if<OtherPtr>(&that.node);
		while(xs && ys) {
			builder.push_back(func((*xs)->head, (*ys)->head));
			xs = std::get_if<NodePtr>(&(*xs)->tail.node);
			ys = std::get_if<OtherPtr>(&(*ys)->tail.node);
		}
		return builder.build();
	}

	constexpr bool starts_with(const Sequence& prefix) const {
		auto xs = std::get_if<NodePtr>(&this->node);
		auto ys = std::get_if<NodePtr>(&prefix.node);
		for(; ys; ys = std::get_if<NodePtr>(&(*ys)->tail.node)) {
			if(!xs || !((*xs)->head == (*ys)->head)) return false;
			xs = std::get_if<NodePtr>(&(*xs)->tail.node);
		}
		return true;
	}

	// Contiguous match of that at any offset, retried from every element.
	constexpr bool has_subsequence(const Sequence& that) const {
		for(Sequence rest = *this; ; rest = rest.tail()) {
			if(rest.starts_with(that)) return true;
			if(rest.empty()) return false;
		}
	}

	struct iterator {
		using value_type = Value;
		using difference_type = std::ptrdiff_t;
		using reference = const Value&;
		using pointer = const Value*;
		using iterator_category = std::forward_iterator_tag;

		Sequence list;

		iterator() : list() { }
		iterator(const iterator&) = default;
		explicit iterator(const Sequence& list) : list(list) { }
		iterator& operator =(const iterator&) = default;

		inline constexpr iterator& operator ++()
			{ this->list = this->list.tail(); return *this; }
		inline constexpr iterator operator ++(int)
			{ iterator copy(*this); ++*this; return copy; }
		inline constexpr const Value& operator *() const
			{ return this->list.head(); }
		inline constexpr const Value* operator ->() const
			{ return &this->list.head(); }
		inline constexpr bool operator ==(const iterator& that) const
			{ return this->list.node == that.list.node; }
		inline constexpr bool operator !=(const iterator& that) const
			{ return !(*this == that); }
	};

	using const_iterator = iterator;

	inline constexpr iterator begin() const
		{ return iterator(*this); }
	inline constexpr iterator end() const
		{ return iterator(); }

	// Stops early once both sides reach the same shared suffix.
	constexpr bool operator ==(const Sequence& that) const {
		auto xs = std::get_if<NodePtr>(&this->node);
		auto ys = std::get_if<NodePtr>(&that.node);
		while(xs && ys) {
			if(*xs == *ys) return true;
			if(!((*xs)->head == (*ys)->head)) return false;
			xs = std::get_if<NodePtr>(&(*xs)->tail.node);
			ys = std::get_if<NodePtr>(&(*ys)->tail.node);
		}
		return !xs && !ys;
	}

	inline constexpr bool operator !=(const Sequence& that) const
		{ return !(*this == that); }

	constexpr bool operator <(const Sequence& that) const {
		return less_iterator<iterator, iterator, std::less<Value>>
			(this->begin(), this->end(), that.begin(), that.end());
	}

	inline constexpr bool operator >(const Sequence& that) const
		{ return (that < *this); }
	inline constexpr bool operator <=(const Sequence& that) const
		{ return !(that < *this); }
	inline constexpr bool operator >=(const Sequence& that) const
		{ return !(*this < that); }

	friend std::ostream& operator <<(std::ostream& out, const Sequence& list)
		{ return out << ShowIterator(list.begin(), list.end(), "[", "]", ", "); }

	// LCOV_EXCL_START
	std::string pretty() const {
		std::ostringstream out;
		out << *this;
		return out.str();
	}
	// LCOV_EXCL_STOP
};

template<typename Value, typename Allocator, typename OuterAllocator>
constexpr Sequence<Value, Allocator> concat(
	const Sequence<Sequence<Value, Allocator>, OuterAllocator>& lists
) {
	using List = Sequence<Value, Allocator>;
	return lists.fold_right_via_fold_left(List(),
		[](const List& list, const List& acc) { return list.append(acc); });
}

template<typename Value, typename Allocator>
constexpr Value sum(const Sequence<Value, Allocator>& list)
	{ return list.fold_left(Value(0), std::plus<Value>{}); }

template<typename Value, typename Allocator>
constexpr Value sum_via_fold_right(const Sequence<Value, Allocator>& list)
	{ return list.fold_right(Value(0), std::plus<Value>{}); }

// Stops at the first zero element.
template<typename Value, typename Allocator>
constexpr double product(const Sequence<Value, Allocator>& list) {
	double result = 1.0;
	for(const Value& value: list) {
		if(value == Value(0)) return 0.0;
		result *= value;
	}
	return result;
}

template<typename Value, typename Allocator>
constexpr double product_via_fold_left(const Sequence<Value, Allocator>& list) {
	return list.fold_left(1.0,
		[](double acc, const Value& value) { return acc * value; });
}

template<typename Value, typename Allocator>
constexpr Sequence<Value, Allocator> add_one(const Sequence<Value, Allocator>& list) {
	using List = Sequence<Value, Allocator>;
	return list.fold_right_via_fold_left(List(),
		[](const Value& value, const List& acc) { return List(value + 1, acc); });
}

// Renders every element with operator <<.
template<typename Value, typename Allocator>
constexpr typename Sequence<Value, Allocator>::template Rebind<std::string>
to_strings(const Sequence<Value, Allocator>& list) {
	using Result = typename Sequence<Value, Allocator>::template Rebind<std::string>;
	return list.fold_right_via_fold_left(Result(),
		[](const Value& value, const Result& acc) {
			std::ostringstream out;
			out << value;
			return Result(out.str(), acc);
		});
}

template<typename Value, typename Allocator>
constexpr Sequence<Value, Allocator> add_pairwise(
	const Sequence<Value, Allocator>& xs,
	const Sequence<Value, Allocator>& ys
) {
	return xs.zip_with(ys, std::plus<Value>{});
}

}

template<typename Value, typename Allocator>
struct std::hash<fpds::Sequence<Value, Allocator>>
	: public fpds::HashIterable<fpds::Sequence<Value, Allocator>> { };
