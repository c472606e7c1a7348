#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace runbox::script {

class ScriptLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// http://, https:// and file:// scripts are loaded by reference; anything
// else is inline module source.
bool IsUrlReference(const std::string& script);

// Fetches module source for a URL reference. Throws ScriptLoadError.
std::string FetchScript(const std::string& url,
                        std::chrono::milliseconds timeout = std::chrono::seconds(10));

}  // namespace runbox::script
