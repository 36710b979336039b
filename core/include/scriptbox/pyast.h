#pragma once

// Syntax tree for submitted Python source.
//
// Each node carries a tagged payload: the node kinds the policy validator
// inspects (Import, ImportFrom, Call, Attribute, Name) have their own case,
// every other kind is a Generic node labelled with its Python AST class name
// ("Module", "FunctionDef", "BinOp", ...). Sub-expressions and nested
// statements are plain children, in source order.

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace scriptbox::pyast {

struct Generic { std::string kind; };

// import a.b [as c], d
struct Import { std::vector<std::string> modules; };

// from [.]*module import names; `module` is empty for "from . import x"
struct ImportFrom {
    std::string module;
    int level{0};
    std::vector<std::string> names;
};

// children[0] is the callee, the rest are arguments
struct Call {};

// children[0] is the object the attribute is read from
struct Attribute { std::string attr; };

struct Name { std::string id; };

using NodeData = std::variant<Generic, Import, ImportFrom, Call, Attribute, Name>;

struct Node;
using NodePtr = std::unique_ptr<Node>;

struct Node {
    int line{0};
    NodeData data;
    std::vector<NodePtr> children;

    Node(int ln, NodeData d) : line(ln), data(std::move(d)) {}
    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;
    // Iterative teardown: left-deep chains (a.b.c... or 1+1+1...) can be
    // far deeper than the call stack allows.
    ~Node();

    std::string kind() const;

    template <class T>
    const T* as() const { return std::get_if<T>(&data); }

    template <class T>
    bool is() const { return std::holds_alternative<T>(data); }

    Node* add(NodePtr child) {
        children.push_back(std::move(child));
        return children.back().get();
    }
};

NodePtr make_node(int line, NodeData data);
NodePtr make_generic(int line, const char* kind);

// Pre-order traversal with an explicit stack; `fn(const Node&)` sees every
// node exactly once, parents before children, siblings in source order.
template <class Fn>
void walk(const Node& root, Fn&& fn) {
    std::vector<const Node*> stack{&root};
    while (!stack.empty()) {
        const Node* n = stack.back();
        stack.pop_back();
        fn(*n);
        for (auto it = n->children.rbegin(); it != n->children.rend(); ++it) {
            if (*it) stack.push_back(it->get());
        }
    }
}

// Debug rendering: one node per line, two-space indent per depth.
std::string dump(const Node& root);

} // namespace scriptbox::pyast
