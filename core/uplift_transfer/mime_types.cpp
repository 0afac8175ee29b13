// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "mime_types.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace uplift {
namespace transfer {

namespace {

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string stripParameters(const std::string& mime_type) {
  std::string base = mime_type.substr(0, mime_type.find(';'));
  while (!base.empty() && std::isspace(static_cast<unsigned char>(base.back()))) {
    base.pop_back();
  }
  return toLower(base);
}

const std::map<std::string, std::string>& extensionTable() {
  static const std::map<std::string, std::string> table = {
    {"pdf", "application/pdf"},
    {"doc", "application/msword"},
    {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {"xls", "application/vnd.ms-excel"},
    {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {"ppt", "application/vnd.ms-powerpoint"},
    {"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
    {"txt", "text/plain"},
    {"log", "text/plain"},
    {"md", "text/markdown"},
    {"csv", "text/csv"},
    {"html", "text/html"},
    {"htm", "text/html"},
    {"json", "application/json"},
    {"xml", "application/xml"},
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"png", "image/png"},
    {"gif", "image/gif"},
    {"webp", "image/webp"},
    {"svg", "image/svg+xml"},
    {"zip", "application/zip"},
    {"rar", "application/x-rar-compressed"},
    {"gz", "application/gzip"},
    {"mp3", "audio/mpeg"},
    {"wav", "audio/wav"},
    {"mp4", "video/mp4"},
    {"mov", "video/quicktime"},
  };
  return table;
}

struct Signature {
  std::string mime_type;
  std::vector<uint8_t> magic;
};

const std::vector<Signature>& signatureTable() {
  static const std::vector<Signature> table = {
    {"application/pdf", {0x25, 0x50, 0x44, 0x46}},
    {"image/png", {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A}},
    {"image/jpeg", {0xFF, 0xD8, 0xFF}},
    {"image/gif", {0x47, 0x49, 0x46, 0x38, 0x37, 0x61}},
    {"image/gif", {0x47, 0x49, 0x46, 0x38, 0x39, 0x61}},
    {"application/zip", {0x50, 0x4B, 0x03, 0x04}},
    {"application/zip", {0x50, 0x4B, 0x05, 0x06}},
    {"application/zip", {0x50, 0x4B, 0x07, 0x08}},
    {"application/gzip", {0x1F, 0x8B}},
    {"application/x-rar-compressed", {0x52, 0x61, 0x72, 0x21, 0x1A, 0x07}},
  };
  return table;
}

// Container formats whose files carry another format's signature.
std::string signatureFamily(const std::string& mime_type) {
  static const std::map<std::string, std::string> aliases = {
    {"image/jpg", "image/jpeg"},
    {"image/pjpeg", "image/jpeg"},
    {"application/x-zip-compressed", "application/zip"},
    {"application/x-gzip", "application/gzip"},
    {"application/vnd.rar", "application/x-rar-compressed"},
    {"application/vnd.openxmlformats-officedocument.wordprocessingml.document", "application/zip"},
    {"application/vnd.openxmlformats-officedocument.spreadsheetml.sheet", "application/zip"},
    {"application/vnd.openxmlformats-officedocument.presentationml.presentation", "application/zip"},
  };
  const std::string base = stripParameters(mime_type);
  auto it = aliases.find(base);
  return it == aliases.end() ? base : it->second;
}

bool startsWith(const std::vector<uint8_t>& data, const std::vector<uint8_t>& prefix) {
  return data.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), data.begin());
}

}  // namespace

std::string extensionOf(const std::string& filename) {
  auto parts = extensionsOf(filename);
  return parts.empty() ? "" : parts.back();
}

std::vector<std::string> extensionsOf(const std::string& filename) {
  std::vector<std::string> result;
  // A leading dot marks a hidden file, not an extension.
  size_t start = filename.find_first_not_of('.');
  if (start == std::string::npos) {
    return result;
  }
  size_t pos = filename.find('.', start);
  while (pos != std::string::npos) {
    size_t next = filename.find('.', pos + 1);
    std::string part = filename.substr(pos + 1, next == std::string::npos ? std::string::npos : next - pos - 1);
    if (!part.empty()) {
      result.push_back(toLower(part));
    }
    pos = next;
  }
  return result;
}

std::string mimeTypeForExtension(const std::string& extension) {
  const auto& table = extensionTable();
  auto it = table.find(toLower(extension));
  return it == table.end() ? "" : it->second;
}

std::string mimeTypeForFilename(const std::string& filename) {
  std::string mime = mimeTypeForExtension(extensionOf(filename));
  return mime.empty() ? "application/octet-stream" : mime;
}

bool sameMimeType(const std::string& a, const std::string& b) {
  const std::string lhs = stripParameters(a);
  const std::string rhs = stripParameters(b);
  if (lhs == rhs) {
    return true;
  }
  // Aliases only; container mapping does not make docx the same as zip.
  auto canonical = [](const std::string& m) {
    if (m == "image/jpg" || m == "image/pjpeg") return std::string("image/jpeg");
    if (m == "application/x-zip-compressed") return std::string("application/zip");
    if (m == "application/x-gzip") return std::string("application/gzip");
    if (m == "application/vnd.rar") return std::string("application/x-rar-compressed");
    if (m == "text/xml") return std::string("application/xml");
    return m;
  };
  return canonical(lhs) == canonical(rhs);
}

bool mimeMatches(const std::string& pattern, const std::string& mime_type) {
  const std::string p = stripParameters(pattern);
  const std::string m = stripParameters(mime_type);
  if (p == "*" || p == "*/*") {
    return true;
  }
  if (p.size() > 2 && p.compare(p.size() - 2, 2, "/*") == 0) {
    return m.compare(0, p.size() - 1, p, 0, p.size() - 1) == 0;
  }
  return sameMimeType(p, m);
}

std::optional<std::string> detectMimeType(const std::vector<uint8_t>& header) {
  for (const auto& sig : signatureTable()) {
    if (startsWith(header, sig.magic)) {
      return sig.mime_type;
    }
  }
  return std::nullopt;
}

bool hasKnownSignature(const std::string& mime_type) {
  const std::string family = signatureFamily(mime_type);
  const auto& table = signatureTable();
  return std::any_of(table.begin(), table.end(), [&](const Signature& sig) {
    return sig.mime_type == family;
  });
}

bool signatureMatches(const std::string& mime_type, const std::vector<uint8_t>& header) {
  const std::string family = signatureFamily(mime_type);
  bool known = false;
  for (const auto& sig : signatureTable()) {
    if (sig.mime_type != family) {
      continue;
    }
    known = true;
    if (startsWith(header, sig.magic)) {
      return true;
    }
  }
  return !known;
}

std::string categoryOf(const std::string& mime_type) {
  const std::string m = stripParameters(mime_type);
  if (m.rfind("image/", 0) == 0) return "image";
  if (m.rfind("audio/", 0) == 0) return "audio";
  if (m.rfind("video/", 0) == 0) return "video";
  if (m.find("spreadsheet") != std::string::npos || m == "application/vnd.ms-excel" ||
      m == "text/csv") {
    return "spreadsheet";
  }
  if (m.find("presentation") != std::string::npos || m == "application/vnd.ms-powerpoint") {
    return "presentation";
  }
  if (m == "application/pdf" || m == "application/msword" ||
      m.find("wordprocessing") != std::string::npos) {
    return "document";
  }
  if (m == "application/zip" || m == "application/gzip" || m == "application/x-rar-compressed" ||
      m == "application/x-zip-compressed" || m == "application/vnd.rar") {
    return "archive";
  }
  if (m.rfind("text/", 0) == 0 || m == "application/json" || m == "application/xml") {
    return "text";
  }
  return "other";
}

bool isTextBased(const std::string& mime_type) {
  const std::string m = stripParameters(mime_type);
  return m.rfind("text/", 0) == 0 || m == "application/json" || m == "application/xml" ||
         m == "image/svg+xml" || m == "application/xhtml+xml";
}

const std::vector<std::string>& defaultAllowedTypes() {
  static const std::vector<std::string> types = {
    "application/pdf",
    "application/msword",
    "application/vnd.openxmlformats-officedocument.wordprocessingml.document",
    "text/plain",
    "image/jpeg",
    "image/png",
    "image/gif",
    "image/svg+xml",
    "application/zip",
    "application/x-rar-compressed",
    "text/csv",
    "application/json",
    "application/xml",
  };
  return types;
}

}  // namespace transfer
}  // namespace uplift
