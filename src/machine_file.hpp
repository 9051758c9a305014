#pragma once
#include "event.hpp"
#include <string>
#include <vector>

constexpr int MACHINE_FILE_VERSION = 1;
const char* const MACHINE_FILE_SUFFIX = ".osh";

struct MachineFile {
    int format_version = MACHINE_FILE_VERSION;
    std::string machine_id;
    double created_at = 0.0;
    std::vector<Event> events;      // ascending sequence
    size_t corrupt_records = 0;     // lines skipped while loading
};

// Identity of one machine's installation; names its published files.
struct MachineIdentity {
    std::string machine_id;
    double created_at = 0.0;
    std::string token;

    std::string fileName() const;
};

// Throws CorruptFile when the file cannot be opened, the header cannot be
// parsed or the format_version is unknown. Unparsable event lines and events
// of another machine are skipped and counted. A trailing line without a
// newline is treated as not yet written.
MachineFile load_machine_file(const std::string& path);

std::string serialize_machine_file(const MachineFile& file);

// Write-new-then-rename. Throws std::system_error; the previous content of
// path survives any failure.
void write_file_atomic(const std::string& path, const std::string& content);
void write_machine_file(const std::string& path, const MachineFile& file);

std::string random_token(size_t length = 8);
