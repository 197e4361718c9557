#pragma once

#include "config.h"
#include <string>
#include <mutex>

// Uploads recordings over FTP(S). One libcurl handle is kept and reused so
// consecutive uploads share the control connection.
class FtpUploader {
public:
    explicit FtpUploader(const FtpSettings& settings);
    ~FtpUploader();

    FtpUploader(const FtpUploader&) = delete;
    FtpUploader& operator=(const FtpUploader&) = delete;

    bool connect();
    bool upload(const std::string& local_path);
    void close();

    static std::string buildUrl(const std::string& host, int port,
                                const std::string& remote_path,
                                const std::string& file_name);

private:
    FtpSettings settings_;
    std::mutex upload_mutex_;

    // CURL handle (opaque pointer to avoid including curl headers)
    void* curl_handle_;

    bool initializeCurl();
    void cleanupCurl();

    static size_t readCallback(char* buffer, size_t size, size_t nitems, void* userp);
};
