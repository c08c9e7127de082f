#pragma once

#include <memory>
#include <cstddef>
#include <algorithm>
#include <variant>
#include <sstream>
#include <type_traits>
#include <stdexcept>

#include "_utility.hpp"

namespace fpds {

template<typename Value, typename Allocator=std::allocator<Value>>
struct BinaryTree {
	struct Node;

	using NodePtr = std::shared_ptr<const Node>;

	template<typename Other>
	using Rebind = BinaryTree<Other,
		typename std::allocator_traits<Allocator>::template rebind_alloc<Other>>;

	template<typename Func>
	using Mapped = Rebind<std::decay_t<std::invoke_result_t<const Func&, const Value&>>>;

	struct Leaf {
		const Value value;
	};

	struct Branch {
		const NodePtr left;
		const NodePtr right;
	};

	struct Node : public std::variant<Leaf, Branch> {
		using Variant = std::variant<Leaf, Branch>;

		template<typename ...Args>
		static inline NodePtr make(Args&&... args) {
			return std::allocate_shared<Node>
				(Allocator{}, std::forward<Args>(args)...);
		}

		explicit Node(const Value& value) : Variant(Leaf{value}) { }
		Node(const NodePtr& left, const NodePtr& right)
			: Variant(Branch{left, right}) { }

		// Both subtrees are folded, left first, before on_branch combines them.
		template<typename LeafFunc, typename BranchFunc>
		constexpr std::decay_t<std::invoke_result_t<const LeafFunc&, const Value&>>
		fold(const LeafFunc& on_leaf, const BranchFunc& on_branch) const {
			using Result = std::decay_t<std::invoke_result_t<const LeafFunc&, const Value&>>;
			return std::visit(overloaded {
				[&](const Leaf& leaf) -> Result { return on_leaf(leaf.value); },
				[&](const Branch& branch) -> Result {
					Result left = branch.left->fold(on_leaf, on_branch);
					Result right = branch.right->fold(on_leaf, on_branch);
					return on_branch(std::move(left), std::move(right));
				},
			}, *this);
		}

		constexpr size_t size() const {
			return std::visit(overloaded {
				[](const Leaf& _) -> size_t { return 1; },
				[](const Branch& branch) -> size_t
					{ return branch.left->size() + branch.right->size() + 1; },
			}, *this);
		}

		constexpr size_t depth() const {
			return std::visit(overloaded {
				[](const Leaf& _) -> size_t { return 0; },
				[](const Branch& branch) -> size_t
					{ return std::max(branch.left->depth(), branch.right->depth()) + 1; },
			}, *this);
		}

		constexpr Value maximum() const {
			return std::visit(overloaded {
				[](const Leaf& leaf) -> Value { return leaf.value; },
				[](const Branch& branch) -> Value
					{ return std::max(branch.left->maximum(), branch.right->maximum()); },
			}, *this);
		}

		template<typename Func>
		constexpr typename Mapped<Func>::NodePtr
		transform(const Func& func) const {
			using RNode = typename Mapped<Func>::Node;
			using RNodePtr = typename Mapped<Func>::NodePtr;
			return std::visit(overloaded {
				[&](const Leaf& leaf) -> RNodePtr
					{ return RNode::make(func(leaf.value)); },
				[&](const Branch& branch) -> RNodePtr {
					return RNode::make(
						branch.left->transform(func),
						branch.right->transform(func));
				},
			}, *this);
		}

		constexpr bool operator ==(const Node& that) const {
			if(this == &that) return true;
			return std::visit(overloaded {
				[](const Leaf& x, const Leaf& y)
					{ return bool(x.value == y.value); },
				[](const Branch& x, const Branch& y)
					{ return *x.left == *y.left && *x.right == *y.right; },
				[](const Leaf&, const Branch&) { return false; },
				[](const Branch&, const Leaf&) { return false; },
			}, static_cast<const Variant&>(*this), static_cast<const Variant&>(that));
		}

		// LCOV_EXCL_START
		void pretty(std::ostream& out) const {
			std::visit(overloaded {
				[&](const Leaf& leaf) {
					out << "Leaf(" << leaf.value << ")";
				},
				[&](const Branch& branch) {
					out << "Branch(";
					branch.left->pretty(out);
					out << ", ";
					branch.right->pretty(out);
					out << ")";
				},
			}, *this);
		}
		// LCOV_EXCL_STOP
	};

	NodePtr node;

	BinaryTree(const BinaryTree&) = default;
	explicit BinaryTree(const NodePtr& node) : node(node) { }
	explicit BinaryTree(const Value& value) : node(Node::make(value)) { }
	BinaryTree(const BinaryTree& left, const BinaryTree& right)
		: node(Node::make(left.node, right.node)) { }

	inline BinaryTree& operator =(const BinaryTree& that) noexcept
		{ this->node = that.node; return *this; }

	constexpr bool is_leaf() const
		{ return std::holds_alternative<Leaf>(*this->node); }

	constexpr const Value& value() const {
		return std::visit(overloaded {
			[](const Leaf& leaf) -> const Value& { return leaf.value; },
			[](const Branch& _) -> const Value&
				{ throw std::logic_error("branch has no value"); },
		}, *this->node);
	}

	constexpr BinaryTree left() const {
		return std::visit(overloaded {
			[](const Leaf& _) -> BinaryTree
				{ throw std::logic_error("leaf has no children"); },
			[](const Branch& branch) -> BinaryTree
				{ return BinaryTree(branch.left); },
		}, *this->node);
	}

	constexpr BinaryTree right() const {
		return std::visit(overloaded {
			[](const Leaf& _) -> BinaryTree
				{ throw std::logic_error("leaf has no children"); },
			[](const Branch& branch) -> BinaryTree
				{ return BinaryTree(branch.right); },
		}, *this->node);
	}

	template<typename LeafFunc, typename BranchFunc>
	constexpr std::decay_t<std::invoke_result_t<const LeafFunc&, const Value&>>
	fold(const LeafFunc& on_leaf, const BranchFunc& on_branch) const
		{ return this->node->fold(on_leaf, on_branch); }

	constexpr size_t size() const
		{ return this->node->size(); }

	constexpr size_t depth() const
		{ return this->node->depth(); }

	constexpr Value maximum() const
		{ return this->node->maximum(); }

	template<typename Func>
	constexpr Mapped<Func> transform(const Func& func) const
		{ return Mapped<Func>(this->node->transform(func)); }

	constexpr size_t size_via_fold() const {
		return this->fold(
			[](const Value& _) -> size_t { return 1; },
			[](size_t left, size_t right) { return left + right + 1; });
	}

	constexpr size_t depth_via_fold() const {
		return this->fold(
			[](const Value& _) -> size_t { return 0; },
			[](size_t left, size_t right) { return std::max(left, right) + 1; });
	}

	constexpr Value maximum_via_fold() const {
		return this->fold(
			[](const Value& value) -> Value { return value; },
			[](const Value& left, const Value& right) -> Value
				{ return std::max(left, right); });
	}

	template<typename Func>
	constexpr Mapped<Func> transform_via_fold(const Func& func) const {
		using Result = Mapped<Func>;
		return this->fold(
			[&](const Value& value) { return Result(func(value)); },
			[](const Result& left, const Result& right) { return Result(left, right); });
	}

	constexpr bool operator ==(const BinaryTree& that) const
		{ return *this->node == *that.node; }
	inline constexpr bool operator !=(const BinaryTree& that) const
		{ return !(*this == that); }

	friend std::ostream& operator <<(std::ostream& out, const BinaryTree& tree)
		{ tree.node->pretty(out); return out; }

	// LCOV_EXCL_START
	std::string pretty() const {
		std::ostringstream out;
		out << *this;
		return out.str();
	}
	// LCOV_EXCL_STOP
};

}
