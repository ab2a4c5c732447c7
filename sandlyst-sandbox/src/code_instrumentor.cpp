#include "code_instrumentor.hpp"
#include <sstream>
#include <cctype>
#include <cstring>

namespace sandlyst {

std::string instrumentation_header() {
    std::ostringstream oss;
    oss << "import os\n";
    oss << "os.makedirs('/out/mplconfig', exist_ok=True)\n";
    oss << "os.makedirs('/out/.cache', exist_ok=True)\n";
    oss << "os.environ['MPLCONFIGDIR'] = '/out/mplconfig'\n";
    oss << "os.environ['XDG_CACHE_HOME'] = '/out/.cache'\n";
    oss << "os.environ['HOME'] = '/out'\n";
    oss << "os.environ.setdefault('FONTCONFIG_PATH', '/etc/fonts')\n";
    oss << "import matplotlib\n";
    oss << "matplotlib.use('Agg')\n";
    oss << "import numpy as np\n";
    oss << "import pandas as pd\n";
    oss << "import matplotlib.pyplot as plt\n";
    return oss.str();
}

std::string plot_guard() {
    std::ostringstream oss;
    oss << "def _suppressed_pyplot_call(*args, **kwargs):\n";
    oss << "    return None\n";
    oss << "plt.show = _suppressed_pyplot_call\n";
    oss << "plt.savefig = _suppressed_pyplot_call\n";
    return oss.str();
}

std::string plot_footer(const std::string& figure_dir) {
    std::ostringstream oss;
    oss << "_figure_dir = '/out/" << figure_dir << "'\n";
    oss << "try:\n";
    oss << "    import os as _os, shutil as _shutil\n";
    oss << "    import matplotlib.pyplot as _plt\n";
    oss << "    _shutil.rmtree(_figure_dir, ignore_errors=True)\n";
    oss << "    _os.makedirs(_figure_dir)\n";
    oss << "    _figs = [_plt.figure(n) for n in _plt.get_fignums()]\n";
    oss << "    for _i, _fig in enumerate(_figs, start=1):\n";
    oss << "        _fig.savefig(f'{_figure_dir}/" << kArtifactPrefix << "{_i}" << kArtifactExtension
        << "', dpi=150, bbox_inches='tight')\n";
    oss << "except Exception as _e:\n";
    oss << "    print(f'Failed to auto-save plots: {_e}')\n";
    return oss.str();
}

std::string instrument(const std::string& code, ExecutionMode mode, const std::string& figure_dir) {
    std::string result = instrumentation_header();
    if (mode == ExecutionMode::PLOT) {
        result += plot_guard();
    }
    result += "\n";
    result += code;
    if (!code.empty() && code.back() != '\n') {
        result += "\n";
    }
    if (mode == ExecutionMode::PLOT) {
        result += "\n";
        result += plot_footer(figure_dir);
    }
    return result;
}

int parse_artifact_index(const std::string& filename) {
    const size_t prefix_len = std::strlen(kArtifactPrefix);
    const size_t ext_len = std::strlen(kArtifactExtension);

    if (filename.size() <= prefix_len + ext_len) {
        return -1;
    }
    if (filename.compare(0, prefix_len, kArtifactPrefix) != 0) {
        return -1;
    }
    if (filename.compare(filename.size() - ext_len, ext_len, kArtifactExtension) != 0) {
        return -1;
    }

    std::string digits = filename.substr(prefix_len, filename.size() - prefix_len - ext_len);
    if (digits.size() > 9) {
        return -1;
    }
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return -1;
        }
    }
    return std::stoi(digits);
}

} // namespace sandlyst
