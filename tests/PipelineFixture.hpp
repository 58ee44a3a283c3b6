#pragma once
#include "FakeRunner.hpp"
#include "build/Config.hpp"
#include "util/Units.hpp"

#include <string>

namespace gadgetimg::testing {

// One volume: a 4MiB vfat system-boot at 1MiB and a size-0 ext4 structure
// at 5MiB that leaves the rest of the disk to the writable partition.
inline const char* kExampleGadget =
  "volumes:\n"
  "  pc:\n"
  "    bootloader: grub\n"
  "    structure:\n"
  "      - name: system-boot\n"
  "        offset: 1M\n"
  "        size: 4M\n"
  "        type: EF,C12A7328-F81F-11D2-BA4B-00A0C93EC93B\n"
  "        filesystem: vfat\n"
  "        filesystem-label: system-boot\n"
  "        content:\n"
  "          - source: grubx64.efi\n"
  "            target: EFI/boot/grubx64.efi\n"
  "          - source: shim.efi.signed\n"
  "            target: EFI/boot/bootx64.efi\n"
  "      - name: data\n"
  "        offset: 5M\n"
  "        type: 83,0FC63DAF-8483-4772-8E79-3D69D8477DE4\n"
  "        filesystem: ext4\n";

inline build::BuildConfig example_config(const ScratchDir& dir, const std::string& tag) {
  build::BuildConfig c;
  c.model_assertion = (dir.path / "pc.model").string();
  c.channel = "stable";
  c.workdir = dir.path / ("work-" + tag);
  c.output = dir.path / ("out-" + tag) / "disk.img";
  c.total_image_size = util::MiB(64);
  c.reserved_tail = 4096;
  c.sudo = "sudo";
  return c;
}

inline void use_example_gadget(FakeRunner& runner) { runner.gadget_yaml = kExampleGadget; }

} // namespace gadgetimg::testing
