#include "scriptbox/wrapper.h"

#include <cstdio>

namespace scriptbox {

std::string python_str_literal(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char ch : s) {
        unsigned char c = (unsigned char)ch;
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '\'': out += "\\'"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (c < 0x20 || c == 0x7f) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\x%02x", (unsigned)c);
                out += buf;
            } else {
                out.push_back(ch);
            }
        }
    }
    out.push_back('\'');
    return out;
}

std::string build_runner(const std::filesystem::path& script_path,
                         const std::filesystem::path& output_dir) {
    std::string py;
    py += "import os\n";
    py += "import sys\n";
    py += "\n";
    py += "_sb_output_dir = " + python_str_literal(output_dir.string()) + "\n";
    py += "_sb_script = " + python_str_literal(script_path.string()) + "\n";
    py += "_sb_counter = [0]\n";
    py += "\n";
    py += "try:\n";
    py += "    import matplotlib\n";
    py += "    matplotlib.use(\"Agg\")\n";
    py += "    import matplotlib.pyplot as _sb_plt\n";
    py += "except Exception:\n";
    py += "    _sb_plt = None\n";
    py += "\n";
    py += "def _sb_save_figures(*args, **kwargs):\n";
    py += "    if _sb_plt is None:\n";
    py += "        return\n";
    py += "    for _num in _sb_plt.get_fignums():\n";
    py += "        _fig = _sb_plt.figure(_num)\n";
    py += "        _sb_counter[0] += 1\n";
    py += "        _path = os.path.join(_sb_output_dir, \"plot_%03d.png\" % _sb_counter[0])\n";
    py += "        _fig.savefig(_path, dpi=150, bbox_inches=\"tight\", facecolor=\"white\")\n";
    py += "    _sb_plt.close(\"all\")\n";
    py += "\n";
    py += "if _sb_plt is not None:\n";
    py += "    _sb_plt.show = _sb_save_figures\n";
    py += "\n";
    // bytes, so the source is decoded exactly as the validator decoded it
    py += "with open(_sb_script, \"rb\") as _f:\n";
    py += "    _sb_source = _f.read()\n";
    py += "\n";
    py += "try:\n";
    py += "    _sb_code = compile(_sb_source, " + python_str_literal(kScriptFileName) + ", \"exec\")\n";
    py += "    exec(_sb_code, {\"__name__\": \"__main__\", \"__builtins__\": __builtins__})\n";
    py += "except SystemExit:\n";
    py += "    raise\n";
    py += "except BaseException:\n";
    py += "    import traceback\n";
    py += "    _t, _v, _tb = sys.exc_info()\n";
    // drop the launcher's own frame from the traceback
    py += "    traceback.print_exception(_t, _v, _tb.tb_next if _tb is not None else None)\n";
    py += "    sys.stderr.flush()\n";
    py += "    sys.exit(1)\n";
    py += "\n";
    py += "_sb_save_figures()\n";
    return py;
}

} // namespace scriptbox
