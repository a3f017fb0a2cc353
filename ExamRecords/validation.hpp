#pragma once
#include <string>
#include <regex>
#include <algorithm>
#include <iostream>
#include <cctype>
#include <stdexcept>

/*
-------------------------------------------------------------------------------
 validation.hpp - Input validation and console prompt helpers (ASCII only)
-------------------------------------------------------------------------------
What this file provides:
  - trim: basic whitespace trimming helper.
  - Validators: term code, CSV path.
  - Prompt helpers for interactive console:
      * prompt_until_valid_or_back    -> text until validator passes, Back/Exit
      * prompt_int_or_back            -> integer with range and Back/Exit
      * prompt_text_or_back           -> free text (may be empty), Back/Exit
      * confirm_or_back               -> yes/no confirmation (Back on no)

Conventions:
  - Special inputs:
      Back: "b", "B", and "0" where 0 is not itself an answer
      Exit: "x", "X", "q", "Q", or end of input
  - Answers are trimmed before any check.
-------------------------------------------------------------------------------
*/

// Trim leading and trailing whitespace.
inline std::string trim(std::string s) {
    auto ws = [](unsigned char ch) { return std::isspace(ch) != 0; };
    s.erase(s.begin(), std::find_if_not(s.begin(), s.end(), ws));
    s.erase(std::find_if_not(s.rbegin(), s.rend(), ws).base(), s.end());
    return s;
}

// e.g. 2025-06 (year-month). Terms in loaded files are free text; this only
// guards what the user types at the prompt.
inline bool is_valid_term(const std::string& x) {
    if (x.empty() || x.size() > 40) return false;
    return std::none_of(x.begin(), x.end(), [](unsigned char c) { return std::iscntrl(c); });
}

// path ending in .csv (any case)
inline bool is_valid_csv_path(const std::string& x) {
    static const std::regex re(".+\\.[cC][sS][vV]$");
    return std::regex_match(x, re);
}

// ---- back / exit aware prompts ----
enum class InputCtl { Ok, Back, Exit };

// Read one line for a prompt. Returns false at end of input (treated as Exit).
// A stream error other than EOF is cleared and reads as an empty line.
inline bool read_answer(std::string& v) {
    if (std::getline(std::cin, v)) { v = trim(v); return true; }
    if (std::cin.eof()) return false;
    std::cin.clear();
    v.clear();
    return true;
}

// Maps the Back/Exit keywords. "0" only counts as Back where it is not a
// legal answer (text prompts, confirmations).
inline bool is_control_key(const std::string& v, bool zero_is_back, InputCtl& ctl) {
    if (v == "b" || v == "B" || (zero_is_back && v == "0")) { ctl = InputCtl::Back; return true; }
    if (v == "x" || v == "X" || v == "q" || v == "Q") { ctl = InputCtl::Exit; return true; }
    return false;
}

// Text prompt that repeats until `validator` accepts the (trimmed) answer.
inline InputCtl prompt_until_valid_or_back(
    const std::string& label,
    std::string& out,
    bool (*validator)(const std::string&),
    const std::string& error_msg)
{
    std::string v;
    InputCtl ctl;
    for (;;) {
        std::cout << label << " (0=Back, x=Exit): ";
        if (!read_answer(v)) return InputCtl::Exit;
        if (v.empty()) continue;
        if (is_control_key(v, true, ctl)) return ctl;
        if (validator(v)) { out = v; return InputCtl::Ok; }
        std::cout << "  -> " << error_msg << "\n";
    }
}

// Free-text prompt; Enter gives an empty string. Used for search.
inline InputCtl prompt_text_or_back(const std::string& label, std::string& out)
{
    std::string v;
    InputCtl ctl;
    std::cout << label << " (Enter=all, b=Back, x=Exit): ";
    if (!read_answer(v)) return InputCtl::Exit;
    if (is_control_key(v, false, ctl)) return ctl;
    out = v;
    return InputCtl::Ok;
}

// Whole number in [lo, hi]. 0 is an ordinary value here, so Back is "b".
inline InputCtl prompt_int_or_back(
    const std::string& label,
    int& out,
    int lo, int hi)
{
    std::string v;
    InputCtl ctl;
    for (;;) {
        std::cout << label << " [" << lo << "-" << hi << "] (b=Back, x=Exit): ";
        if (!read_answer(v)) return InputCtl::Exit;
        if (v.empty()) continue;
        if (is_control_key(v, false, ctl)) return ctl;

        int d = 0;
        try {
            std::size_t used = 0;
            d = std::stoi(v, &used);
            if (used != v.size()) throw std::invalid_argument(v);
        }
        catch (const std::invalid_argument&) {
            std::cout << "  -> Please enter a whole number.\n";
            continue;
        }
        catch (const std::out_of_range&) {
            std::cout << "  -> Number is too large.\n";
            continue;
        }
        if (d < lo || d > hi) {
            std::cout << "  -> Must be between " << lo << " and " << hi << ".\n";
            continue;
        }
        out = d;
        return InputCtl::Ok;
    }
}

// y/Y confirms. Enter, n, N or the Back key cancel.
inline InputCtl confirm_or_back(const std::string& msg) {
    std::string v;
    InputCtl ctl;
    for (;;) {
        std::cout << msg << " [y/N] (x=Exit): ";
        if (!read_answer(v)) return InputCtl::Exit;
        if (v == "y" || v == "Y") return InputCtl::Ok;
        if (v.empty() || v == "n" || v == "N") return InputCtl::Back;
        if (is_control_key(v, true, ctl)) return ctl;
        std::cout << "  -> Please enter y or n.\n";
    }
}
