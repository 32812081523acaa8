/**
 * @file rewriter.hpp
 * @brief Literal search-and-replace over file contents
 *
 * @details Two strategies share one substitution routine:
 *
 *          - replace_in_file: whole file in memory, for files at or below
 *            the large-file threshold
 *
 *          - replace_in_large_file: line-by-line streaming with a
 *            cancellation check before each line
 *
 *          Both write to a sibling temporary file and rename it over the
 *          original, so a failed or cancelled rewrite leaves the original
 *          untouched.
 */

#ifndef REPLACER_REWRITER_HPP
#define REPLACER_REWRITER_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "types.hpp"

namespace replacer {

class CancellationToken;

/**
 * @struct RewriteResult
 * @brief Outcome of a successful rewrite.
 */
struct RewriteResult {
  bool changed = false;       //< The file was replaced on disk
  size_t replacements = 0;    //< Occurrences substituted
  uint64_t bytes_written = 0; //< Size of the new content
};

/**
 * @brief Replace every non-overlapping occurrence of search, left to right.
 *
 * @note An empty search string matches nothing; the input is copied as is.
 *
 * @param data Input bytes
 * @param size Number of input bytes
 * @param search Literal pattern
 * @param replace Replacement text
 * @param out Receives the transformed bytes (appended)
 * @return Number of occurrences replaced
 */
size_t replace_all(const char *data, size_t size, const std::string &search,
                   const std::string &replace, std::string &out);

/// Convenience overload returning the transformed string
std::string replace_all(const std::string &input, const std::string &search,
                        const std::string &replace);

/**
 * @brief Rewrite a file by loading it whole.
 *
 * @note Files with no occurrence (including empty files) are left alone
 *       and reported with changed == false.
 *
 * @return true on success, false with error filled
 */
bool replace_in_file(const std::string &path, const std::string &search,
                     const std::string &replace, RewriteResult &result,
                     Error &error);

/**
 * @brief Rewrite a file by streaming it line by line.
 *
 * @note Every output line is terminated by '\n', so a file lacking a
 *       trailing newline gains one. The file is always rewritten.
 *
 * @return true on success; false with error filled on I/O failure or when
 *         cancel fired (the original is then unchanged)
 */
bool replace_in_large_file(const std::string &path, const std::string &search,
                           const std::string &replace,
                           const CancellationToken &cancel,
                           RewriteResult &result, Error &error);

} // namespace replacer

#endif // REPLACER_REWRITER_HPP
