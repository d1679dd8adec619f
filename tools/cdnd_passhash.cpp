// tools/cdnd_passhash.cpp
//
// Prints SHA-256(password) as lowercase hex: the value the login page sends
// and the server expects in CDND_PASSWORD_HASH.
//
// Usage:
//   printf '%s' 'my password' | ./build/bin/cdnd_passhash
//
// The password is read from stdin (one line, trailing CR/LF stripped) so it
// never shows up in the process list or shell history.

#include <iostream>
#include <string>

#include "cdnd_util.h"

int main() {
    std::string pw;
    if (!std::getline(std::cin, pw)) {
        std::cerr << "usage: printf '%s' PASSWORD | cdnd_passhash" << std::endl;
        return 2;
    }
    while (!pw.empty() && (pw.back() == '\r' || pw.back() == '\n')) pw.pop_back();
    if (pw.empty()) {
        std::cerr << "empty password" << std::endl;
        return 2;
    }

    std::cout << cdnd::sha256_hex(pw) << std::endl;
    return 0;
}
