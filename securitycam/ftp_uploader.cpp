#include "ftp_uploader.h"
#include "logger.h"
#include <filesystem>
#include <cstdio>
#include <memory>
#include <curl/curl.h>

namespace fs = std::filesystem;

size_t FtpUploader::readCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    FILE* file = static_cast<FILE*>(userp);
    return std::fread(buffer, size, nitems, file);
}

FtpUploader::FtpUploader(const FtpSettings& settings)
    : settings_(settings)
    , curl_handle_(nullptr) {
}

FtpUploader::~FtpUploader() {
    close();
}

std::string FtpUploader::buildUrl(const std::string& host, int port,
                                  const std::string& remote_path,
                                  const std::string& file_name) {
    std::string path = remote_path;

    // collapse to "dir/sub/" form without the leading slash
    while (!path.empty() && path.front() == '/') {
        path.erase(0, 1);
    }
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    if (!path.empty()) {
        path += "/";
    }

    std::string url = "ftp://" + host + ":" + std::to_string(port) + "/";
    // %2F makes libcurl start from the server root instead of the login dir
    if (!remote_path.empty() && remote_path.front() == '/') {
        url += "%2F";
    }
    return url + path + file_name;
}

bool FtpUploader::connect() {
    if (curl_handle_) {
        return true;
    }
    return initializeCurl();
}

bool FtpUploader::initializeCurl() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        logError("FtpUploader", "FTP connection error: failed to initialize CURL");
        return false;
    }

    // set separately so a ':' in the user name survives
    curl_easy_setopt(curl_handle_, CURLOPT_USERNAME, settings_.username.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_PASSWORD, settings_.password.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl_handle_, CURLOPT_FTP_CREATE_MISSING_DIRS, static_cast<long>(CURLFTP_CREATE_DIR_RETRY));
    curl_easy_setopt(curl_handle_, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl_handle_, CURLOPT_READFUNCTION, readCallback);

    // abort uploads that stall below 1 KiB/s for 30 s
    curl_easy_setopt(curl_handle_, CURLOPT_LOW_SPEED_LIMIT, 1024L);
    curl_easy_setopt(curl_handle_, CURLOPT_LOW_SPEED_TIME, 30L);

    if (settings_.use_tls) {
        curl_easy_setopt(curl_handle_, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
        curl_easy_setopt(curl_handle_, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl_handle_, CURLOPT_SSL_VERIFYHOST, 2L);
        if (!settings_.ca_cert_path.empty()) {
            curl_easy_setopt(curl_handle_, CURLOPT_CAINFO, settings_.ca_cert_path.c_str());
        }
    }

    logInfo("FtpUploader", "Initialized for ftp://" + settings_.host + ":" + std::to_string(settings_.port) +
            (settings_.use_tls ? " (TLS)" : ""));
    return true;
}

void FtpUploader::cleanupCurl() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
        curl_handle_ = nullptr;
    }
}

bool FtpUploader::upload(const std::string& local_path) {
    std::lock_guard<std::mutex> lock(upload_mutex_);

    try {
        if (!fs::exists(local_path)) {
            logInfo("FtpUploader", "Error: Local file " + local_path + " not found");
            return false;
        }

        if (!connect()) {
            return false;
        }

        std::string file_name = fs::path(local_path).filename().string();
        std::string url = buildUrl(settings_.host, settings_.port, settings_.remote_path, file_name);

        std::unique_ptr<FILE, decltype(&std::fclose)> file(std::fopen(local_path.c_str(), "rb"), &std::fclose);
        if (!file) {
            logError("FtpUploader", "FTP upload error: cannot open " + local_path);
            return false;
        }

        auto file_size = static_cast<curl_off_t>(fs::file_size(local_path));

        curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_handle_, CURLOPT_READDATA, file.get());
        curl_easy_setopt(curl_handle_, CURLOPT_INFILESIZE_LARGE, file_size);

        CURLcode result = curl_easy_perform(curl_handle_);
        file.reset();

        if (result != CURLE_OK) {
            logError("FtpUploader", std::string("FTP upload error: ") + curl_easy_strerror(result));
            // drop the connection, the next upload reconnects
            cleanupCurl();
            return false;
        }

        logInfo("FtpUploader", "Successfully uploaded " + local_path + " to remote server");

        std::error_code ec;
        if (fs::remove(local_path, ec)) {
            logInfo("FtpUploader", "Removed local file " + local_path);
        } else {
            logWarning("FtpUploader", "Could not remove local file " + local_path + ": " + ec.message());
        }
        return true;

    } catch (const std::exception& e) {
        logError("FtpUploader", std::string("FTP upload error: ") + e.what());
        return false;
    }
}

void FtpUploader::close() {
    std::lock_guard<std::mutex> lock(upload_mutex_);
    cleanupCurl();
}
