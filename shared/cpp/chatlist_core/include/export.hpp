#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include "result_store.hpp"

enum class ExportFormat { Markdown, Json };

bool parse_export_format(const std::string& s, ExportFormat& out);

std::string export_markdown(const std::vector<ResultRecord>& results, const std::string& exported_at);
std::string export_json(const std::vector<ResultRecord>& results);

// Writes every selected result; returns how many were written.
std::size_t export_selected(ResultStore& store, ExportFormat format, const std::filesystem::path& out);
