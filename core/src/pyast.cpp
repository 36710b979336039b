#include "scriptbox/pyast.h"

#include <sstream>
#include <utility>

namespace scriptbox::pyast {

namespace {
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
} // namespace

Node::~Node() {
    std::vector<NodePtr> pending;
    pending.reserve(children.size());
    for (auto& c : children) {
        if (c) pending.push_back(std::move(c));
    }
    while (!pending.empty()) {
        NodePtr n = std::move(pending.back());
        pending.pop_back();
        for (auto& c : n->children) {
            if (c) pending.push_back(std::move(c));
        }
        n->children.clear();
    }
}

std::string Node::kind() const {
    return std::visit(overloaded{
        [](const Generic& g) { return g.kind; },
        [](const Import&) { return std::string("Import"); },
        [](const ImportFrom&) { return std::string("ImportFrom"); },
        [](const Call&) { return std::string("Call"); },
        [](const Attribute&) { return std::string("Attribute"); },
        [](const Name&) { return std::string("Name"); },
    }, data);
}

NodePtr make_node(int line, NodeData data) {
    return std::make_unique<Node>(line, std::move(data));
}

NodePtr make_generic(int line, const char* kind) {
    return std::make_unique<Node>(line, Generic{kind});
}

std::string dump(const Node& root) {
    std::ostringstream out;
    std::vector<std::pair<const Node*, int>> stack{{&root, 0}};
    while (!stack.empty()) {
        auto [n, depth] = stack.back();
        stack.pop_back();
        out << std::string((size_t)depth * 2, ' ') << n->kind();
        std::visit(overloaded{
            [](const Generic&) {},
            [&](const Import& i) {
                for (const auto& m : i.modules) out << " " << m;
            },
            [&](const ImportFrom& f) {
                out << " " << std::string((size_t)f.level, '.') << f.module;
            },
            [](const Call&) {},
            [&](const Attribute& a) { out << " ." << a.attr; },
            [&](const Name& nm) { out << " " << nm.id; },
        }, n->data);
        out << " @" << n->line << "\n";
        for (auto it = n->children.rbegin(); it != n->children.rend(); ++it) {
            if (*it) stack.push_back({it->get(), depth + 1});
        }
    }
    return out.str();
}

} // namespace scriptbox::pyast
