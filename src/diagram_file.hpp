#pragma once
/*
 * DiagramFile
 *
 * Purpose: JSON form of a Diagram and the <title>.json / <title>.txt files.
 * Note: malformed or missing documents fall back to a fresh diagram; the
 * reason is reported through msg.
 */
#include <filesystem>
#include <optional>
#include <string>
#include "diagram.hpp"

std::string diagram_to_json(const Diagram& d);
std::optional<Diagram> diagram_from_json(const std::string& text, std::string& msg);

std::optional<Diagram> load_diagram_file(const std::filesystem::path& path, std::string& msg);
bool save_diagram_file(const std::filesystem::path& path, const Diagram& d, std::string& msg);

std::filesystem::path diagram_json_path(const std::filesystem::path& dir, const std::string& title);
std::filesystem::path diagram_text_path(const std::filesystem::path& dir, const std::string& title);

// Load <dir>/<title>.json into out; on failure out is a fresh diagram titled
// `title` and false is returned with the reason in msg.
bool open_or_create(const std::string& title, const std::filesystem::path& dir, Diagram& out, std::string& msg);
