#include "exam/shuffler.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>
#include "common/exceptions.hpp"

namespace ladder {
using namespace std;

string sha256_hex(const string &data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (!EVP_Digest(data.data(), data.size(), digest, &length, EVP_sha256(), nullptr))
        throw internal_error("unable to compute sha256 digest");

    ostringstream ss;
    ss << hex << setfill('0');
    for (unsigned int i = 0; i < length; ++i)
        ss << setw(2) << static_cast<int>(digest[i]);
    return ss.str();
}

string shuffle_key(const string &participant_id, const string &exam_id, const string &question_id) {
    return sha256_hex(participant_id + "-" + exam_id + question_id);
}

vector<question> order_questions(vector<question> questions, const string &participant_id, const string &exam_id) {
    vector<pair<string, size_t>> keys;
    keys.reserve(questions.size());
    for (size_t i = 0; i < questions.size(); ++i)
        keys.emplace_back(shuffle_key(participant_id, exam_id, questions[i].id), i);
    stable_sort(keys.begin(), keys.end());

    vector<question> result;
    result.reserve(questions.size());
    for (auto &[key, index] : keys)
        result.push_back(move(questions[index]));
    return result;
}

}  // namespace ladder
