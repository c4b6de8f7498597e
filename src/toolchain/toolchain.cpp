#include "toolchain/toolchain.hpp"
#include <boost/algorithm/string/replace.hpp>

namespace arbiter {
using namespace std;

const char *SOURCE_FILE_PATH_VAR = "Run.SourceFilePath";
const char *BINARY_FILE_PATH_VAR = "Run.BinaryFilePath";

static string substitute(string value, const map<string, string> &substitutions) {
    for (auto &[name, replacement] : substitutions)
        boost::algorithm::replace_all(value, "$(" + name + ")", replacement);
    return value;
}

command_template command_template::expand(const map<string, string> &substitutions) const {
    command_template result;
    result.cwd = substitute(cwd, substitutions);
    for (auto &arg : argv)
        result.argv.push_back(substitute(arg, substitutions));
    for (auto &[key, value] : env)
        result.env[key] = substitute(value, substitutions);
    return result;
}

}  // namespace arbiter
