#include <gtest/gtest.h>
#include "fixtures/archive_builder.hpp"
#include "ugate/routing/router.hpp"

using namespace ugate;
using namespace ugate::fixtures;

namespace {
RoutingDecision route(const std::string& head, const std::string& ext) {
  return routeByMagic(reinterpret_cast<const unsigned char*>(head.data()), head.size(), ext);
}
}

TEST(RouterTest, ZipMagic) {
  EXPECT_EQ(route(std::string("PK\x03\x04", 4), ".zip").type, ContainerType::Zip);
  EXPECT_EQ(route(std::string("PK\x05\x06", 4), ".zip").type, ContainerType::Zip);
  EXPECT_EQ(route(std::string("PK\x03\x04", 4), ".jar").type, ContainerType::Jar);
  EXPECT_EQ(route(std::string("PK\x03\x04", 4), ".jar").handler, "jar");
  EXPECT_EQ(route(std::string("PK\x03\x04", 4), ".zip").reason, "magic");
}

TEST(RouterTest, CompressedTarMagic) {
  EXPECT_EQ(route(std::string("\x1f\x8b\x08\x00", 4), ".gz").type, ContainerType::TarGz);
  EXPECT_EQ(route("BZh9", ".bz2").type, ContainerType::TarBz2);
  EXPECT_EQ(route("BZh9", ".bz2").handler, "tar_bz2");
}

TEST(RouterTest, UnknownAndShortHeads) {
  EXPECT_EQ(route("hello", ".zip").type, ContainerType::Unknown);
  EXPECT_EQ(route("PK", ".zip").type, ContainerType::Unknown);
  EXPECT_EQ(route("BZ", ".bz2").type, ContainerType::Unknown);
  EXPECT_EQ(route("", "").handler, "");
}

TEST(RouterTest, ExtensionLower) {
  EXPECT_EQ(extensionLower("a/B.ZIP"), ".zip");
  EXPECT_EQ(extensionLower("x.tar.GZ"), ".gz");
  EXPECT_EQ(extensionLower("README"), "");
}

TEST(RouterTest, NestedArchiveExtensions) {
  EXPECT_TRUE(isArchiveExtension("lib/inner.JAR"));
  EXPECT_TRUE(isArchiveExtension("x.7z"));
  EXPECT_TRUE(isArchiveExtension("x.tar"));
  EXPECT_FALSE(isArchiveExtension("x.txt"));
  EXPECT_FALSE(isArchiveExtension("zip"));
}

TEST(RouterTest, RoutesRealFiles) {
  ScratchDir dir;
  writeZip(dir / "a.jar", {Member::file("m.txt", "x")});
  writeTarGz(dir / "a.tar.gz", {Member::file("m.txt", "x")});
  writeTarBz2(dir / "a.tar.bz2", {Member::file("m.txt", "x")});
  writeBytes(dir / "plain.zip", "not an archive");

  EXPECT_EQ(routeToHandler(dir / "a.jar").type, ContainerType::Jar);
  EXPECT_EQ(routeToHandler(dir / "a.tar.gz").type, ContainerType::TarGz);
  EXPECT_EQ(routeToHandler(dir / "a.tar.bz2").type, ContainerType::TarBz2);
  EXPECT_EQ(routeToHandler(dir / "plain.zip").type, ContainerType::Unknown);
  EXPECT_EQ(routeToHandler(dir / "missing.zip").type, ContainerType::Unknown);
}

TEST(RouterTest, MakesReaderPerContainer) {
  RoutingDecision rd;
  EXPECT_EQ(makeReader(rd, 1024), nullptr);
  rd.type = ContainerType::Zip;
  auto zip = makeReader(rd, 1024);
  ASSERT_NE(zip, nullptr);
  EXPECT_TRUE(zip->perEntryCompression());
  rd.type = ContainerType::TarBz2;
  auto tar = makeReader(rd, 1024);
  ASSERT_NE(tar, nullptr);
  EXPECT_FALSE(tar->perEntryCompression());
}
