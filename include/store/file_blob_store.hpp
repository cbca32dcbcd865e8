#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "store/blob_store.hpp"

namespace deepzoom {
namespace store {

// Blob store on the local filesystem, addressed by the SHA-256 of the key
class FileBlobStore : public BlobStore {
public:

  // ---- CONSTRUCTOR ----
  FileBlobStore(const std::string& base_path, const std::string& public_base_url);


  // ---- BLOB STORE OPERATIONS ----
  bool exists(const std::string& key) override;
  std::string put(const std::string& key, const std::vector<uint8_t>& data,
                  const std::string& content_type) override;
  std::string public_url(const std::string& key) const override;


  // ---- LOCAL OPERATIONS ----
  // Reads the stored object, throws pipeline::StorageError if missing
  std::vector<uint8_t> get(const std::string& key) const;

private:
  // ---- PARAMETERS ----
  // Root path for all stored files
  std::filesystem::path base_path_;
  std::string public_base_url_;

  
  // ---- CAS STORAGE SUPPORT ----
  // Creates a directory structure using parts of the hash:
  // {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
  std::filesystem::path get_path_for_hash(const std::string& hash) const;
  // Resolves a key to its corresponding filesystem path
  std::filesystem::path resolve_key_path(const std::string& key) const;
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
};

} // namespace store
} // namespace deepzoom
