#pragma once
/**
 * @file uuid.hpp
 * @brief Random (version 4) UUIDs for message identity, plus the short display form.
 */

#include <string>

namespace dtchat {

/// New lowercase RFC 4122 v4 UUID, "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx".
/// Safe to call from any thread.
std::string generate_uuid();

/// First 8 characters of an id (the whole id if shorter). Used in logs and UI.
std::string short_id(const std::string& uuid);

/// True if @p s has the 8-4-4-4-12 hex layout.
bool looks_like_uuid(const std::string& s);

} // namespace dtchat
