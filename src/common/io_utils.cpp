#include "common/io_utils.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace ladder {
using namespace std;

string read_file_content(const filesystem::path &path) {
    ifstream fin(path.string());
    if (!fin)
        throw runtime_error("Unable to open file " + path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_stdin_content() {
    return string((istreambuf_iterator<char>(cin)),
                  (istreambuf_iterator<char>()));
}

}  // namespace ladder
