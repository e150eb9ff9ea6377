#include "clone/clone_manifest.hpp"
#include "common/logger.hpp"
#include <openssl/evp.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

CloneManifest::CloneManifest(const std::string& domainName, bool diskOnly, bool quiesce)
    : domainName_(domainName)
    , diskOnly_(diskOnly)
    , quiesce_(quiesce)
    , timestamp_(std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch()).count()) {
}

void CloneManifest::addEntry(const ManifestEntry& entry) {
    entries_.push_back(entry);
}

json CloneManifest::toJson() const {
    json manifest;
    manifest["domain"] = domainName_;
    manifest["timestamp"] = timestamp_;
    manifest["diskOnly"] = diskOnly_;
    manifest["quiesce"] = quiesce_;
    manifest["disks"] = json::array();

    for (const auto& entry : entries_) {
        json disk = {
            {"device", entry.disk.device},
            {"source", entry.disk.source},
            {"sourceType", entry.disk.sourceKind},
            {"artifact", entry.artifact}
        };
        if (!entry.sha256.empty()) {
            disk["sha256"] = entry.sha256;
        }
        manifest["disks"].push_back(disk);
    }
    return manifest;
}

bool CloneManifest::write(const std::string& destDir) const {
    std::string manifestFile = (std::filesystem::path(destDir) / "manifest.json").string();
    try {
        std::ofstream file(manifestFile);
        if (!file.is_open()) {
            Logger::error("Failed to open manifest file for writing: " + manifestFile);
            return false;
        }
        file << toJson().dump(4);
        Logger::info("Manifest written to " + manifestFile);
        return true;
    } catch (const std::exception& e) {
        Logger::error("Failed to write manifest: " + std::string(e.what()));
        return false;
    }
}

std::string CloneManifest::calculateChecksum(const std::string& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        Logger::error("Failed to open " + filePath + " for checksum");
        return "";
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        Logger::error("Failed to create OpenSSL context");
        return "";
    }

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        Logger::error("Failed to initialize digest");
        return "";
    }

    char buffer[65536];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        if (file.gcount() > 0 && EVP_DigestUpdate(ctx, buffer, file.gcount()) != 1) {
            EVP_MD_CTX_free(ctx);
            Logger::error("Failed to update digest");
            return "";
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(ctx);
        Logger::error("Failed to finalize digest");
        return "";
    }
    EVP_MD_CTX_free(ctx);

    std::stringstream ss;
    for (unsigned int i = 0; i < hashLen; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}
