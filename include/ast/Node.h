/***
 * Name: rbparse::ast::Node
 * Purpose: Base of the closed AST hierarchy.
 * Theory of Operation:
 *   Every node owns its children through ordered slots (NodePtr, null for an
 *   absent child). slotCount()/slot(i) expose every owned slot and are what
 *   rewriting passes walk; childNodes() is the public traversal range and
 *   yields the first childCount() slots, gaps included. accept<R>() is
 *   defined in ast/Visitor.h.
 *   Nodes are built by the parser's reduction actions and rewritten in place
 *   by the post-processing passes; after Parser::parse returns they are only
 *   reachable through const references.
 */
#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "ast/NodeKind.h"
#include "rbparse/support/SourceRange.h"

namespace rbparse::ast {

    template <typename R>
    class Visitor;

    struct Node;
    using NodePtr = std::unique_ptr<Node>;

    // Lazy, restartable view over a node's children; yields nullptr for gaps.
    class ChildRange {
      public:
        class iterator {
          public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = const Node*;
            using difference_type = std::ptrdiff_t;
            using pointer = const Node* const*;
            using reference = const Node*;

            iterator() = default;
            iterator(const Node* owner, std::size_t index) : owner_(owner), index_(index) {}

            const Node* operator*() const;
            iterator& operator++() {
                ++index_;
                return *this;
            }
            iterator operator++(int) {
                iterator copy = *this;
                ++index_;
                return copy;
            }
            bool operator==(const iterator& other) const { return owner_ == other.owner_ && index_ == other.index_; }
            bool operator!=(const iterator& other) const { return !(*this == other); }

          private:
            const Node* owner_{nullptr};
            std::size_t index_{0};
        };

        explicit ChildRange(const Node& owner);

        iterator begin() const { return {owner_, 0}; }
        iterator end() const { return {owner_, size_}; }
        std::size_t size() const { return size_; }
        bool empty() const { return size_ == 0; }
        const Node* operator[](std::size_t index) const;

      private:
        const Node* owner_;
        std::size_t size_;
    };

    struct Node {
        NodeKind kind;
        SourceRange range;

        Node(const NodeKind k, const SourceRange r) : kind(k), range(r) {}
        virtual ~Node() = default;
        Node(const Node&) = delete;
        Node& operator=(const Node&) = delete;
        Node(Node&&) = delete;
        Node& operator=(Node&&) = delete;

        // Owned child slots, gaps included, in source order.
        virtual std::size_t slotCount() const { return 0; }
        virtual const NodePtr* slot(std::size_t /*index*/) const { return nullptr; }
        NodePtr* mutableSlot(const std::size_t index) {
            return const_cast<NodePtr*>(std::as_const(*this).slot(index));
        }

        // Slots reported by childNodes(); a prefix of the owned slots.
        virtual std::size_t childCount() const { return slotCount(); }
        ChildRange childNodes() const { return ChildRange(*this); }
        const Node* child(std::size_t index) const;

        // Widens the range while the reduction that owns the node is running.
        void setRange(const SourceRange r) { range = r; }

        template <typename R>
        R accept(Visitor<R>& visitor) const;
    };

    namespace detail {
        template <typename... Slots>
        constexpr std::size_t countSlots(const Slots&... /*slots*/) {
            return sizeof...(Slots);
        }

        template <typename... Slots>
        const NodePtr* pickSlot(const std::size_t index, const Slots&... slots) {
            const NodePtr* table[] = {&slots...};
            return index < sizeof...(Slots) ? table[index] : nullptr;
        }
    } // namespace detail

// Declares the slot accessors of a node from its NodePtr members, in order.
#define RBPARSE_AST_SLOTS(...)                                                                              \
    std::size_t slotCount() const override { return ::rbparse::ast::detail::countSlots(__VA_ARGS__); }         \
    const ::rbparse::ast::NodePtr* slot(std::size_t index) const override {                                 \
        return ::rbparse::ast::detail::pickSlot(index, __VA_ARGS__);                                        \
    }

    // Binds a concrete struct to its tag; as<T>() relies on kKind.
    template <NodeKind K>
    struct NodeBase : Node {
        static constexpr NodeKind kKind = K;
        explicit NodeBase(const SourceRange r) : Node(K, r) {}
    };

    struct HasName {
        std::string name;
    };

    // Variable-length child list: statement blocks, argument lists, array and hash elements, string parts.
    struct SequenceNode : Node {
        std::vector<NodePtr> items;

        SequenceNode(const NodeKind k, const SourceRange r) : Node(k, r) {}

        std::size_t slotCount() const override { return items.size(); }
        const NodePtr* slot(const std::size_t index) const override {
            return index < items.size() ? &items[index] : nullptr;
        }

        void add(NodePtr item) {
            if (item) { range = SourceRange::cover(range, item->range); }
            items.push_back(std::move(item));
        }
        std::size_t size() const { return items.size(); }
        bool empty() const { return items.empty(); }
    };

    template <NodeKind K>
    struct Sequence : SequenceNode {
        static constexpr NodeKind kKind = K;
        explicit Sequence(const SourceRange r) : SequenceNode(K, r) {}
    };

    template <typename T>
    const T* as(const Node* node) {
        return node != nullptr && node->kind == T::kKind ? static_cast<const T*>(node) : nullptr;
    }

    template <typename T>
    T* as(Node* node) {
        return node != nullptr && node->kind == T::kKind ? static_cast<T*>(node) : nullptr;
    }

} // namespace rbparse::ast
