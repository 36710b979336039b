#include "scriptbox/pyparse.h"

#include <pybind11/embed.h>

#include <utility>
#include <vector>

namespace py = pybind11;

namespace scriptbox::pyast {

namespace {

// Process-wide interpreter, started on first use. The GIL is released right
// after start-up so any thread can take it with gil_scoped_acquire.
class EmbeddedPython {
public:
    static void ensure() {
        static EmbeddedPython instance;
        (void)instance;
    }

    EmbeddedPython(const EmbeddedPython&) = delete;
    EmbeddedPython& operator=(const EmbeddedPython&) = delete;

private:
    EmbeddedPython() {
        // Already hosted inside a Python process: nothing to own.
        if (Py_IsInitialized()) return;
        // Signal handling stays with the host process.
        py::initialize_interpreter(false);
        main_state_ = PyEval_SaveThread();
    }

    ~EmbeddedPython() {
        if (!main_state_) return;
        PyEval_RestoreThread(main_state_);
        py::finalize_interpreter();
    }

    PyThreadState* main_state_{nullptr};
};

// The handful of `ast` entry points the copy needs. GIL must be held.
struct AstApi {
    py::module_ ast;
    py::object iter_child_nodes;
    py::object import_cls;
    py::object import_from_cls;
    py::object call_cls;
    py::object attribute_cls;
    py::object name_cls;
    // Load/Store contexts and operator singletons carry no source.
    py::tuple markers;

    AstApi() : ast(py::module_::import("ast")) {
        iter_child_nodes = ast.attr("iter_child_nodes");
        import_cls = ast.attr("Import");
        import_from_cls = ast.attr("ImportFrom");
        call_cls = ast.attr("Call");
        attribute_cls = ast.attr("Attribute");
        name_cls = ast.attr("Name");
        markers = py::make_tuple(ast.attr("expr_context"), ast.attr("boolop"), ast.attr("operator"),
                                 ast.attr("unaryop"), ast.attr("cmpop"));
    }
};

int line_of(py::handle obj, int fallback) {
    py::object ln = py::getattr(obj, "lineno", py::none());
    if (py::isinstance<py::int_>(ln)) {
        int v = ln.cast<int>();
        if (v > 0) return v;
    }
    return fallback;
}

std::vector<std::string> alias_names(py::handle obj) {
    std::vector<std::string> out;
    py::object names = obj.attr("names");
    for (py::handle alias : names) out.push_back(alias.attr("name").cast<std::string>());
    return out;
}

// Nodes without a position of their own (arguments, comprehension,
// match_case on older interpreters) take the line of their parent.
NodePtr copy_node(const AstApi& api, py::handle obj, int parent_line) {
    const int line = line_of(obj, parent_line);
    if (py::isinstance(obj, api.import_cls)) {
        return make_node(line, Import{alias_names(obj)});
    }
    if (py::isinstance(obj, api.import_from_cls)) {
        ImportFrom f;
        py::object mod = obj.attr("module");
        if (!mod.is_none()) f.module = mod.cast<std::string>();
        py::object level = obj.attr("level");
        if (!level.is_none()) f.level = level.cast<int>();
        f.names = alias_names(obj);
        return make_node(line, std::move(f));
    }
    if (py::isinstance(obj, api.call_cls)) return make_node(line, Call{});
    if (py::isinstance(obj, api.attribute_cls)) {
        return make_node(line, Attribute{obj.attr("attr").cast<std::string>()});
    }
    if (py::isinstance(obj, api.name_cls)) return make_node(line, Name{obj.attr("id").cast<std::string>()});
    return make_node(line, Generic{obj.attr("__class__").attr("__name__").cast<std::string>()});
}

// Explicit stack: tree depth is bounded only by the compiler's own limits.
// Children keep ast.iter_child_nodes order, so a Call's callee and an
// Attribute's object come first.
NodePtr copy_tree(const AstApi& api, const py::object& tree) {
    NodePtr root = copy_node(api, tree, 1);
    std::vector<std::pair<py::object, Node*>> pending;
    pending.emplace_back(tree, root.get());
    while (!pending.empty()) {
        auto [obj, node] = std::move(pending.back());
        pending.pop_back();
        for (py::handle child : api.iter_child_nodes(obj)) {
            if (py::isinstance(child, api.markers)) continue;
            Node* c = node->add(copy_node(api, child, node->line));
            pending.emplace_back(py::reinterpret_borrow<py::object>(child), c);
        }
    }
    return root;
}

[[noreturn]] void raise_parse_failure(const py::error_already_set& e) {
    // SyntaxError, IndentationError, TabError
    if (e.matches(PyExc_SyntaxError)) {
        py::object v = e.value();
        std::string msg = py::str(py::getattr(v, "msg", py::str("invalid syntax")));
        throw SyntaxError(msg, line_of(v, 1));
    }
    // How the compiler gives up on sources nested past its own limits.
    if (e.matches(PyExc_RecursionError) || e.matches(PyExc_MemoryError)) {
        throw SyntaxError("too many nested expressions", 1);
    }
    // "source code string cannot contain null bytes"
    if (e.matches(PyExc_ValueError)) {
        std::string msg = py::str(e.value());
        throw SyntaxError(msg, 1);
    }
    throw std::runtime_error(std::string("python parser: ") + e.what());
}

} // namespace

NodePtr parse_module(const std::string& src) {
    EmbeddedPython::ensure();
    py::gil_scoped_acquire gil;
    try {
        AstApi api;
        py::object tree = api.ast.attr("parse")(py::bytes(src), "<submission>", "exec");
        return copy_tree(api, tree);
    } catch (const py::error_already_set& e) {
        raise_parse_failure(e);
    }
}

std::string parser_python_version() {
    EmbeddedPython::ensure();
    py::gil_scoped_acquire gil;
    py::object vi = py::module_::import("sys").attr("version_info");
    return std::to_string(vi.attr("major").cast<int>()) + "." + std::to_string(vi.attr("minor").cast<int>()) +
           "." + std::to_string(vi.attr("micro").cast<int>());
}

bool parser_python_at_least(int major, int minor) {
    EmbeddedPython::ensure();
    py::gil_scoped_acquire gil;
    py::object vi = py::module_::import("sys").attr("version_info");
    const int have_major = vi.attr("major").cast<int>();
    const int have_minor = vi.attr("minor").cast<int>();
    return have_major > major || (have_major == major && have_minor >= minor);
}

} // namespace scriptbox::pyast
