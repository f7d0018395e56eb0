#ifndef AGENTBRIDGE_INTERNAL_CLI_VERIFICATION_HPP
#define AGENTBRIDGE_INTERNAL_CLI_VERIFICATION_HPP

#include <agentbridge/backend.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace agentbridge
{
namespace internal
{

/// Compute SHA256 hash of a file
/// Returns hex-encoded SHA256 hash (64 characters) or std::nullopt on error
std::optional<std::string> compute_file_sha256(const std::filesystem::path& file_path);

/// Verify CLI path is in the allowlist
/// If allowlist is empty, returns true (no restriction)
bool verify_cli_path_allowed(const std::string& cli_path,
                             const std::vector<std::string>& allowed_paths);

/// Verify CLI hash matches expected SHA256
/// If expected_hash is nullopt, returns true (no hash check)
bool verify_cli_hash(const std::filesystem::path& cli_path,
                     const std::optional<std::string>& expected_hash, std::string& error_message);

/// Resolve a backend executable: explicit path, then env_var, then PATH, then
/// fallback locations. Every candidate passes the allow-list and hash pin.
/// Throws CLINotFoundError.
std::string locate_cli(const CliLocation& location, const char* env_var,
                       const std::string& executable_name,
                       const std::vector<std::filesystem::path>& fallback_paths,
                       const std::string& install_hint);

} // namespace internal
} // namespace agentbridge

#endif // AGENTBRIDGE_INTERNAL_CLI_VERIFICATION_HPP
