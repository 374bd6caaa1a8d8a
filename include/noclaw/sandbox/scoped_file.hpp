/*
 * noclaw C++ - Scoped file
 *
 * Owns a path and unlinks it when it goes out of scope, whichever way the
 * scope is left. Used for the request file and the sidecar.
 */
#ifndef noclaw_SANDBOX_SCOPED_FILE_HPP
#define noclaw_SANDBOX_SCOPED_FILE_HPP

#include <string>

namespace noclaw {

class ScopedFile {
public:
    ScopedFile() {}
    explicit ScopedFile(const std::string& path) : path_(path) {}
    ~ScopedFile() { remove(); }

    ScopedFile(ScopedFile&& other) : path_(other.path_) { other.path_.clear(); }
    ScopedFile& operator=(ScopedFile&& other);

    const std::string& path() const { return path_; }
    bool empty() const { return path_.empty(); }

    // Unlink now. A missing file is not an error.
    void remove();

    // Create a 0600 file "<dir>/<prefix>XXXXXX<suffix>" holding `content`.
    // Returns an empty ScopedFile (and sets `error`) on failure.
    static ScopedFile create_temp(const std::string& dir,
                                  const std::string& prefix,
                                  const std::string& suffix,
                                  const std::string& content,
                                  std::string& error);

private:
    ScopedFile(const ScopedFile&);
    ScopedFile& operator=(const ScopedFile&);

    std::string path_;
};

// $TMPDIR or /tmp
std::string temp_directory();

} // namespace noclaw

#endif // noclaw_SANDBOX_SCOPED_FILE_HPP
