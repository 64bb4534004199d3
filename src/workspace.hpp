#pragma once
/*
 * FileWorkspace
 *
 * Purpose: IWorkspace on the real filesystem and system clipboard.
 * Note: files land in save_dir as <title>.txt and <title>.json; clipboard
 * tries the common CLI tools first, then an OSC 52 escape to /dev/tty.
 */
#include <filesystem>
#include <string>
#include "iworkspace.hpp"

class FileWorkspace : public IWorkspace {
public:
  explicit FileWorkspace(std::filesystem::path save_dir) : save_dir_(std::move(save_dir)) {}
  bool save(const Diagram& d, const std::string& ascii, std::string& msg) override;
  bool copy_text(const std::string& ascii, std::string& msg) override;
private:
  std::filesystem::path save_dir_;
};

std::string base64_encode(const std::string& in);
