#include "scriptbox/validator.h"
#include "scriptbox/pyparse.h"

namespace scriptbox {

using namespace pyast;

ValidationResult PolicyValidator::validate(const std::string& source) const {
    NodePtr tree;
    try {
        tree = parse_module(source);
    } catch (const SyntaxError& e) {
        ValidationResult r;
        r.accepted = false;
        r.syntax_error = true;
        r.violations.push_back(
            {e.line(), "Syntax error: " + std::string(e.what()) + " (line " + std::to_string(e.line()) + ")"});
        return r;
    }
    return check_tree(*tree);
}

ValidationResult PolicyValidator::check_tree(const Node& root) const {
    ValidationResult r;
    walk(root, [&](const Node& n) { check_node(n, r); });
    r.accepted = r.violations.empty();
    return r;
}

void PolicyValidator::import_violation(int line, const std::string& module, ValidationResult& out) const {
    out.violations.push_back({line, "Line " + std::to_string(line) + ": import of '" + module +
                                        "' is not allowed. Allowed modules: " +
                                        policy_.allowed_modules_joined()});
}

void PolicyValidator::check_node(const Node& n, ValidationResult& out) const {
    if (const auto* imp = n.as<Import>()) {
        for (const auto& m : imp->modules) {
            if (!policy_.module_allowed(m)) import_violation(n.line, m, out);
        }
        return;
    }
    if (const auto* from = n.as<ImportFrom>()) {
        // "from . import x" has no module name to check.
        if (!from->module.empty() && !policy_.module_allowed(from->module)) {
            import_violation(n.line, from->module, out);
        }
        return;
    }
    if (n.is<Call>()) {
        if (n.children.empty()) return;
        if (const auto* callee = n.children.front()->as<Name>()) {
            if (policy_.blocked_builtins.count(callee->id)) {
                out.violations.push_back({n.line, "Line " + std::to_string(n.line) + ": call to '" +
                                                      callee->id + "()' is not allowed."});
            }
        }
        return;
    }
    if (const auto* attr = n.as<Attribute>()) {
        if (policy_.blocked_attributes.count(attr->attr)) {
            out.violations.push_back({n.line, "Line " + std::to_string(n.line) + ": access to '" +
                                                  attr->attr + "' is not allowed."});
        }
    }
}

} // namespace scriptbox
