#include "store/file_blob_store.hpp"
#include "crypto/digest.hpp"
#include "pipeline/tile_error.hpp"
#include <fstream>
#include <functional>
#include <iterator>
#include <sstream>
#include <system_error>
#include <thread>
#include <boost/log/trivial.hpp>

namespace deepzoom {
namespace store {
  
//==============================================
// CONSTRUCTOR
//==============================================
  
// Initialize store with base directory path and ensure it exists
FileBlobStore::FileBlobStore(const std::string& base_path, const std::string& public_base_url)
  : base_path_(base_path)
  , public_base_url_(public_base_url) {
  BOOST_LOG_TRIVIAL(info) << "File blob store: Initializing store with base path: " << base_path;
  check_directory_exists(base_path_);
  BOOST_LOG_TRIVIAL(debug) << "File blob store: Store directory created/verified at: " << base_path;
}

  
//==============================================
// BLOB STORE OPERATIONS
//==============================================

bool FileBlobStore::exists(const std::string& key) {
  std::filesystem::path file_path = resolve_key_path(key);
  std::error_code ec;
  bool found = std::filesystem::exists(file_path, ec);
  if (ec) {
    throw pipeline::StorageError("Failed to check " + file_path.string() + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(debug) << "File blob store: Key " << key << (found ? " exists" : " not found") 
                           << " at path: " << file_path.string();
  return found;
}

std::string FileBlobStore::put(const std::string& key, const std::vector<uint8_t>& data,
                               const std::string& content_type) {
  if (exists(key)) {
    BOOST_LOG_TRIVIAL(debug) << "File blob store: Key " << key << " already stored, skipping write";
    return public_url(key);
  }

  std::filesystem::path file_path = resolve_key_path(key);
  check_directory_exists(file_path.parent_path());

  // Write beside the target and rename, so a killed process never leaves a partial object
  std::ostringstream suffix;
  suffix << ".tmp." << std::hash<std::thread::id>{}(std::this_thread::get_id());
  std::filesystem::path temp_path = file_path;
  temp_path += suffix.str();

  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw pipeline::StorageError("Failed to create file: " + temp_path.string());
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
      throw pipeline::StorageError("Failed to write file: " + temp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(temp_path, cleanup_ec);
    throw pipeline::StorageError("Failed to move " + temp_path.string() + " into place: " + ec.message());
  }

  BOOST_LOG_TRIVIAL(info) << "File blob store: Stored " << data.size() << " bytes (" << content_type
                          << ") with key: " << key;
  return public_url(key);
}

std::string FileBlobStore::public_url(const std::string& key) const {
  return public_base_url_ + "/" + key;
}


//==============================================
// LOCAL OPERATIONS
//==============================================

std::vector<uint8_t> FileBlobStore::get(const std::string& key) const {
  std::filesystem::path file_path = resolve_key_path(key);
  if (!std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(error) << "File blob store: File not found: " << file_path.string();
    throw pipeline::StorageError("File not found for key: " + key);
  }

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw pipeline::StorageError("Failed to open file: " + file_path.string());
  }
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::filesystem::path FileBlobStore::get_path_for_hash(const std::string& hash) const {
  std::filesystem::path path = base_path_;
  
  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }
  
  path /= hash.substr(6);
  return path;
}

std::filesystem::path FileBlobStore::resolve_key_path(const std::string& key) const {
  return get_path_for_hash(crypto::to_hex(crypto::sha256(key)));
}

void FileBlobStore::check_directory_exists(const std::filesystem::path& path) const {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec && !std::filesystem::is_directory(path)) {
    throw pipeline::StorageError("Failed to create directory " + path.string() + ": " + ec.message());
  }
}

} // namespace store
} // namespace deepzoom
