#include "common/base64.hpp"
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <stdexcept>

namespace arbiter {
using namespace std;
using namespace boost::archive::iterators;

string base64_encode(const string &data) {
    typedef base64_from_binary<transform_width<string::const_iterator, 6, 8>> encoder;
    string result(encoder(data.begin()), encoder(data.end()));
    result.append((3 - data.size() % 3) % 3, '=');
    return result;
}

string base64_decode(const string &data) {
    typedef transform_width<binary_from_base64<string::const_iterator>, 8, 6> decoder;
    if (data.size() % 4 != 0)
        throw invalid_argument("base64 length is not a multiple of 4");

    size_t padding = 0;
    while (padding < 2 && padding < data.size() && data[data.size() - 1 - padding] == '=')
        ++padding;

    // 填充字符替换为 'A'（值为 0），解码后再截掉多余的字节
    string input = data;
    for (size_t i = 0; i < padding; ++i)
        input[input.size() - 1 - i] = 'A';

    try {
        string result(decoder(input.begin()), decoder(input.end()));
        result.resize(result.size() - padding);
        return result;
    } catch (dataflow_exception &ex) {
        throw invalid_argument(string("invalid base64: ") + ex.what());
    }
}

}  // namespace arbiter
