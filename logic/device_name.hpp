/*
 * Device Name - GAP name length limits
 * Pure logic module, no hardware dependencies, testable on host
 */

#ifndef DEVICE_NAME_HPP
#define DEVICE_NAME_HPP

#include <cstddef>
#include <cstdint>

/*
 * Byte length of the longest prefix of name that fits in max_len bytes
 * without splitting a UTF-8 code point.
 */
size_t utf8_truncated_length(const char *name, size_t max_len);

/*
 * Copy name into out (NUL terminated), truncated to max_len bytes at a
 * code point boundary. out_size must be at least max_len + 1.
 * Returns true if the name had to be truncated.
 */
bool device_name_fit(const char *name, size_t max_len, char *out, size_t out_size);

#endif // DEVICE_NAME_HPP
