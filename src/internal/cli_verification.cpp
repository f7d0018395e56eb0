#include "cli_verification.hpp"

#include "subprocess/process.hpp"

#include <agentbridge/errors.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <sstream>

namespace agentbridge
{
namespace internal
{

std::optional<std::string> compute_file_sha256(const std::filesystem::path& file_path)
{
    std::ifstream file(file_path, std::ios::binary);
    if (!file)
        return std::nullopt;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(),
                                                                &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        return std::nullopt;

    const size_t BUFFER_SIZE = 8192;
    char buffer[BUFFER_SIZE];
    while (file.read(buffer, BUFFER_SIZE) || file.gcount() > 0)
    {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1)
            return std::nullopt;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1)
        return std::nullopt;

    // Convert to hex string
    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_len; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);

    return oss.str();
}

bool verify_cli_path_allowed(const std::string& cli_path,
                             const std::vector<std::string>& allowed_paths)
{
    if (allowed_paths.empty())
        return true;

    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path normalized_cli = fs::canonical(cli_path, ec);
    if (ec)
        normalized_cli = fs::path(cli_path);

    for (const auto& allowed : allowed_paths)
    {
        fs::path normalized_allowed = fs::canonical(allowed, ec);
        if (ec)
            normalized_allowed = fs::path(allowed);

        if (normalized_cli == normalized_allowed)
            return true;
    }

    return false;
}

bool verify_cli_hash(const std::filesystem::path& cli_path,
                     const std::optional<std::string>& expected_hash, std::string& error_message)
{
    if (!expected_hash)
        return true;

    // Validate hash format (should be 64 hex characters for SHA256)
    if (expected_hash->length() != 64)
    {
        error_message = "Invalid hash format: expected 64-character hex string";
        return false;
    }

    for (char c : *expected_hash)
    {
        if (!std::isxdigit(static_cast<unsigned char>(c)))
        {
            error_message = "Invalid hash format: contains non-hex characters";
            return false;
        }
    }

    auto actual_hash = compute_file_sha256(cli_path);
    if (!actual_hash)
    {
        error_message = "Failed to compute file hash";
        return false;
    }

    std::string expected_lower = *expected_hash;
    std::transform(expected_lower.begin(), expected_lower.end(), expected_lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (expected_lower != *actual_hash)
    {
        error_message =
            "CLI hash mismatch: expected " + expected_lower + " but got " + *actual_hash;
        return false;
    }

    return true;
}

std::string locate_cli(const CliLocation& location, const char* env_var,
                       const std::string& executable_name,
                       const std::vector<std::filesystem::path>& fallback_paths,
                       const std::string& install_hint)
{
    namespace fs = std::filesystem;

    auto validate = [&location](const std::string& path) -> std::string
    {
        if (!fs::exists(path))
            throw CLINotFoundError("CLI path does not exist: " + path);

        if (!verify_cli_path_allowed(path, location.allowed_cli_paths))
            throw CLINotFoundError("CLI path not in allowlist: " + path +
                                   ". Configure allowed_cli_paths or use explicit path.");

        std::string error_msg;
        if (!verify_cli_hash(path, location.cli_hash_sha256, error_msg))
            throw CLINotFoundError("CLI integrity check failed: " + error_msg);

        return path;
    };

    if (!location.cli_path.empty())
        return validate(location.cli_path);

    if (const char* env_cli = std::getenv(env_var); env_cli != nullptr && env_cli[0] != '\0')
        return validate(std::string(env_cli));

    if (auto found = subprocess::find_executable(executable_name))
        return validate(*found);

    for (const auto& candidate : fallback_paths)
    {
        if (fs::exists(candidate))
            return validate(candidate.string());
    }

    throw CLINotFoundError("Could not find '" + executable_name + "' executable in PATH. " +
                           install_hint);
}

} // namespace internal
} // namespace agentbridge
