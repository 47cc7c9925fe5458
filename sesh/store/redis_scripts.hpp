#pragma once

#include <string>

namespace sesh::store::redis_scripts {

/*
  Helpers shared by every script. TTL arguments are strings: '' means the
  caller did not supply a value, '0' deletes, a positive count arms an expiry
  and anything else clears it.
*/
inline const std::string HELPERS = R"lua(
local function write_field(key, field, value, field_secs)
  if field_secs == '0' then
    redis.call('HDEL', key, field)
    return
  end
  redis.call('HSET', key, field, value)
  local secs = tonumber(field_secs)
  if secs ~= nil and secs > 0 then
    redis.call('HEXPIRE', key, secs, 'FIELDS', 1, field)
  else
    redis.call('HPERSIST', key, 'FIELDS', 1, field)
  end
end

local function apply_key_ttl(key, key_secs)
  if key_secs == '' then
    return
  end
  local secs = tonumber(key_secs)
  if secs ~= nil and secs > 0 then
    redis.call('EXPIRE', key, secs)
  else
    redis.call('PERSIST', key)
  end
end
)lua";

// KEYS[1] session key
// ARGV field, value, key_secs, field_secs, only_if_absent
// Returns 1 when the field was written, 0 when it was already there.
inline const std::string SET = HELPERS + R"lua(
local key = KEYS[1]
if ARGV[5] == '1' and redis.call('HEXISTS', key, ARGV[1]) == 1 then
  return 0
end
if ARGV[3] == '0' then
  redis.call('DEL', key)
  return 1
end
write_field(key, ARGV[1], ARGV[2], ARGV[4])
apply_key_ttl(key, ARGV[3])
return 1
)lua";

// KEYS[1] old session key, KEYS[2] new session key
// ARGV field, value, key_secs, field_secs, field_mode
// field_mode '0' skips the field, '1' writes it, '2' writes it only when the
// moved hash does not hold it yet.
// Returns 0 without touching anything when the new key is taken, 2 when the
// key moved but the field was left alone and 1 otherwise.
inline const std::string SET_AND_RENAME = HELPERS + R"lua(
local old_key = KEYS[1]
local new_key = KEYS[2]
if redis.call('EXISTS', new_key) == 1 then
  return 0
end
if redis.call('EXISTS', old_key) == 1 then
  redis.call('RENAME', old_key, new_key)
end
if ARGV[3] == '0' then
  redis.call('DEL', new_key)
  return 1
end
local result = 1
if ARGV[5] == '1' then
  write_field(new_key, ARGV[1], ARGV[2], ARGV[4])
elseif ARGV[5] == '2' then
  if redis.call('HEXISTS', new_key, ARGV[1]) == 1 then
    result = 2
  else
    write_field(new_key, ARGV[1], ARGV[2], ARGV[4])
  end
end
apply_key_ttl(new_key, ARGV[3])
return result
)lua";

// KEYS[1] session key
// ARGV key_secs, then (field, value, field_secs) triples
inline const std::string SET_MANY = HELPERS + R"lua(
local key = KEYS[1]
if ARGV[1] == '0' then
  redis.call('DEL', key)
  return 1
end
for i = 2, #ARGV, 3 do
  write_field(key, ARGV[i], ARGV[i + 1], ARGV[i + 2])
end
apply_key_ttl(key, ARGV[1])
return 1
)lua";

} // namespace sesh::store::redis_scripts
