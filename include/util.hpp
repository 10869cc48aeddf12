#pragma once
#include "keypass_common.hpp"
#include "logging.hpp"

// ---------- SessionID ----------
std::string generate_session_id();

// ---------- Helpers: input validation ----------
bool contains_control_or_tab_or_null(const std::string& s);
bool valid_title_or_username(const std::string& s);
bool valid_password(const std::string& s);
bool valid_url(const std::string& s);

// code points, not bytes
size_t utf8_length(const byte* s, size_t len);

// ---------- Secret hygiene ----------
void wipe_string(std::string& s);

// ---------- Input normalization ----------
void strip_cr(std::string& s);
void trim_spaces(std::string& s);
int parse_choice(const std::string& s);

// ---------- Menu ----------
void clear_screen();
void print_menu();
