#pragma once
#include <string>
#include <vector>

namespace textutil {

// upper-case, then repair frequent yard-scan misreads: JOI->201, §->2, |->1, O->0 (standalone)
std::string fix_ocr_errors(const std::string& raw);

// keep letters/digits/_/-/whitespace, collapse whitespace runs to one space, trim
std::string clean(const std::string& s);

std::string trim(const std::string& s);

// whitespace split, empty tokens dropped
std::vector<std::string> split_words(const std::string& s);

bool is_word_char(char c);

}
