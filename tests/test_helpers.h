#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>
#include <ftw.h>

#include "form.h"
#include "form_engine.h"
#include "keys.h"

// In-memory byte stream: "no data" once the script is exhausted
class ScriptedByteSource : public ByteSource {
public:
    explicit ScriptedByteSource(const std::string& bytes)
        : bytes_(bytes.begin(), bytes.end())
        , pos_(0) {}

    ReadStatus read_byte(uint8_t& byte) override {
        if (pos_ >= bytes_.size()) {
            return ReadStatus::WouldBlock;
        }
        byte = bytes_[pos_++];
        return ReadStatus::Ok;
    }

    bool read_byte_timeout(int /*timeout_ms*/, uint8_t& byte) override {
        if (pos_ >= bytes_.size()) {
            return false;
        }
        byte = bytes_[pos_++];
        return true;
    }

    size_t remaining() const { return bytes_.size() - pos_; }

private:
    std::vector<uint8_t> bytes_;
    size_t pos_;
};

// Decode every key in a byte script
inline std::vector<Key> decode_all(const std::string& bytes) {
    ScriptedByteSource source(bytes);
    KeyDecoder decoder(source, 0);
    std::vector<Key> keys;
    Key key;
    while (decoder.read_key(key) == ReadStatus::Ok) {
        keys.push_back(key);
    }
    return keys;
}

// Feed a byte script through the decoder into the form; stops at the first non-Continue action
inline FormAction drive(const FormEngine& engine, FormState& state, const std::string& bytes) {
    for (const auto& key : decode_all(bytes)) {
        FormAction action = engine.handle_key(state, key);
        if (action != FormAction::Continue) {
            return action;
        }
    }
    return FormAction::Continue;
}

inline std::vector<TextField> one_field(const std::string& label, bool digits = false) {
    return std::vector<TextField>(1, TextField(label, digits));
}

// Scratch directory removed with everything in it when the object goes away
class TempDir {
public:
    TempDir() {
        char tmpl[] = "/tmp/tunnelform_test_XXXXXX";
        char* dir = mkdtemp(tmpl);
        path_ = dir ? dir : "";
    }

    ~TempDir() {
        if (!path_.empty()) {
            nftw(path_.c_str(), remove_entry, 16, FTW_DEPTH | FTW_PHYS);
        }
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }

    std::string write(const std::string& name, const std::string& content) const {
        std::string file = path_ + "/" + name;
        std::ofstream out(file, std::ios::out | std::ios::trunc);
        out << content;
        return file;
    }

private:
    std::string path_;

    static int remove_entry(const char* path, const struct stat* /*sb*/, int /*type*/, struct FTW* /*ftw*/) {
        return ::remove(path);
    }
};

#endif // TEST_HELPERS_H
