#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace sesh::id {

constexpr std::size_t ID_BYTES = 16;
constexpr std::size_t ID_LENGTH = 22;

//! \brief  Generate a new session id from the system CSPRNG
//! \return 16 random bytes as unpadded url-safe base64 (22 chars), or
//!         nullopt when the CSPRNG cannot be seeded
std::optional<std::string> generate();

//! \brief Check that an incoming id has the shape generate() produces
bool is_valid(const std::string &candidate);

//! \brief Accept an id received from a client, dropping malformed ones
std::optional<std::string> parse(const std::string &candidate);

} // namespace sesh::id
