#pragma once

#include "error.hpp"

#include <filesystem>

namespace kiln::util {

/**
 * @brief Resolves the per-user runtime directory that hosts the listening socket.
 *
 * Unlike the config directory there is no fallback: a missing or relative `XDG_RUNTIME_DIR`
 * is an error because clients locate the socket through it.
 *
 * @return The runtime directory, or `file_not_found` if it is unset or does not exist.
 */
[[nodiscard]] auto resolve_runtime_dir() -> Result<std::filesystem::path>;

/**
 * @brief Returns the config file used when none is given on the command line.
 *
 * Resolution order: `$XDG_CONFIG_HOME/kiln/kiln.toml`, `$HOME/.config/kiln/kiln.toml`, then
 * `config/kiln.toml` relative to the working directory.
 */
[[nodiscard]] auto default_config_path() -> std::filesystem::path;

} // namespace kiln::util
