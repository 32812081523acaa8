/**
 * @file rewriter.cpp
 * @brief In-memory and streaming rewrite implementation
 */

#include "replacer/rewriter.hpp"

#include <string_view>

#include "replacer/cancellation.hpp"
#include "replacer/file_io.hpp"
#include "replacer/logging.hpp"

namespace replacer {

size_t replace_all(const char *data, size_t size, const std::string &search,
                   const std::string &replace, std::string &out) {
  if (search.empty() || size < search.size()) {
    out.append(data, size);
    return 0;
  }

  std::string_view haystack(data, size);
  size_t count = 0;
  size_t pos = 0;
  while (true) {
    size_t hit = haystack.find(search, pos);
    if (hit == std::string_view::npos)
      break;
    out.append(data + pos, hit - pos);
    out.append(replace);
    pos = hit + search.size();
    ++count;
  }
  out.append(data + pos, size - pos);
  return count;
}

std::string replace_all(const std::string &input, const std::string &search,
                        const std::string &replace) {
  std::string out;
  out.reserve(input.size());
  replace_all(input.data(), input.size(), search, replace, out);
  return out;
}

bool replace_in_file(const std::string &path, const std::string &search,
                     const std::string &replace, RewriteResult &result,
                     Error &error) {
  result = RewriteResult{};

  MappedFile file;
  if (!MemoryLoader::load_file(path, file, /*writable=*/true, error))
    return false;

  std::string output;
  output.reserve(file.size());
  size_t count = replace_all(file.data(), file.size(), search, replace, output);
  if (count == 0) {
    LOG_DEBUG("No match in {}", path);
    return true;
  }

  TempFile temp;
  if (!temp.create_beside(path, error))
    return false;
  if (!temp.set_mode(file.mode(), error))
    return false;
  if (!temp.write(output.data(), output.size(), error))
    return false;

  /// Release the mapping before the original is replaced
  file = MappedFile{};

  if (!temp.commit(path, error))
    return false;

  result.changed = true;
  result.replacements = count;
  result.bytes_written = output.size();
  return true;
}

bool replace_in_large_file(const std::string &path, const std::string &search,
                           const std::string &replace,
                           const CancellationToken &cancel,
                           RewriteResult &result, Error &error) {
  result = RewriteResult{};

  if (cancel.poll(error)) {
    error.path = path;
    return false;
  }

  LineReader reader;
  if (!reader.open(path, error))
    return false;

  TempFile temp;
  if (!temp.create_beside(path, error))
    return false;
  if (!temp.set_mode(reader.mode(), error))
    return false;

  std::string line;
  std::string output;
  size_t count = 0;
  uint64_t written = 0;
  while (reader.next(line)) {
    if (cancel.poll(error)) {
      error.path = path;
      LOG_DEBUG("Abandoning {} after {} bytes", path, written);
      return false;
    }

    output.clear();
    count += replace_all(line.data(), line.size(), search, replace, output);
    output.push_back('\n');
    if (!temp.write(output.data(), output.size(), error))
      return false;
    written += output.size();
  }

  if (reader.failed()) {
    error = reader.error();
    return false;
  }
  reader.close();

  if (!temp.commit(path, error))
    return false;

  result.changed = true;
  result.replacements = count;
  result.bytes_written = written;
  return true;
}

} // namespace replacer
