/***
 * Name: pyscope::support (fs)
 * Purpose: Minimal file helpers for reading, writing and removing files and
 *   locating executables on PATH.
 * Inputs: Paths and string buffers
 * Outputs: File contents to/from disk
 * Theory of Operation: Thin wrappers over fstream and std::filesystem to
 *   centralize error handling; failures return false and fill err.
 */
#pragma once

#include <string>

namespace pyscope {
namespace support {

/*** FileExists: True when path names an existing regular file. */
bool FileExists(const std::string& path);

/*** ReadFile: Read entire file into out. Return true on success. */
bool ReadFile(const std::string& path, std::string& out, std::string& err);

/*** WriteFile: Write entire string to path. Return true on success. */
bool WriteFile(const std::string& path, const std::string& data, std::string& err);

/*** RemoveFile: Remove path if present; a missing file is not an error. */
bool RemoveFile(const std::string& path);

/***
 * FindExecutable: Resolve name against PATH (or verify it directly when it
 * contains a '/'). Returns true and fills out with the full path when found.
 */
bool FindExecutable(const std::string& name, std::string& out);

/*** ModuleNameFromPath: Base name with a trailing ".py" removed. */
std::string ModuleNameFromPath(const std::string& path);

}  // namespace support
}  // namespace pyscope
