#pragma once
#include "ugate/readers/IArchiveReader.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace ugate {

enum class ContainerType { Unknown, Zip, Jar, TarGz, TarBz2 };

const char* toString(ContainerType t);

struct RoutingDecision {
  ContainerType type = ContainerType::Unknown;
  std::string handler; // "zip", "jar", "tar_gz", "tar_bz2", "" when unknown
  std::string reason;  // "magic"
};

// Classify a container from its leading bytes. extLower (".jar") only
// distinguishes jar from plain zip.
RoutingDecision routeByMagic(const unsigned char* head, size_t n, const std::string& extLower);

RoutingDecision routeToHandler(const std::filesystem::path& path);

// Lower-cased last suffix including the dot: "a/B.ZIP" -> ".zip"
std::string extensionLower(const std::filesystem::path& p);

// Member name ends in an archive suffix (.zip .jar .tar .gz .bz2 .xz .7z .rar).
bool isArchiveExtension(const std::string& memberName);

std::unique_ptr<IArchiveReader> makeReader(const RoutingDecision& rd, uint64_t streamBudget);

} // namespace ugate
