#pragma once

#include <chrono>
#include <string>

// Checks made on a source device and destination before a job is created

bool isReadable(const std::string& path);
bool isWritableDirectory(const std::string& path);

// Letters, digits, '.', '_' and '-'; not empty and not starting with '-' or '.'
bool isPortableName(const std::string& name);

bool isBlockDevice(const std::string& path);

// True if path (or what it resolves to) is the source of an entry in the
// mount table
bool isMounted(const std::string& path, const std::string& mountTable = "/proc/self/mounts");

// Volume label as reported by blkid, falling back to the identifier in the
// ISO9660 primary volume descriptor. Returns false with error set when
// neither yields a label source.
bool readVolumeLabel(const std::string& path, std::string& label, std::string& error);

// Close the tray of a device source. Image files need no loading.
bool loadMedium(const std::string& path, std::string& error);

// Unmount the source so the extractor gets exclusive access. A source that
// is not mounted is left alone.
bool unmountSource(const std::string& path, std::string& error,
                   const std::string& mountTable = "/proc/self/mounts");

// Eject a device source. Image files are left alone.
bool ejectMedium(const std::string& path, std::string& error);

// Poll once per second until the device can be opened. Always tries at
// least once, even with a zero timeout.
bool waitForReady(const std::string& path, std::chrono::milliseconds timeout,
                  std::chrono::milliseconds interval = std::chrono::seconds(1));
