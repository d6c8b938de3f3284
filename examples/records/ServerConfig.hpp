#pragma once
/// @file ServerConfig.hpp
/// @brief Example configuration record bound to command-line flags

#include <structflag/structflag.hpp>

#include <cstdint>
#include <string>

struct ServerConfig {
    std::string listen_addr = "127.0.0.1";  ///< 바인딩 주소
    int port = 0;
    bool verbose = false;
    StructFlag::Duration read_timeout{};
    uint64_t max_body_bytes = 0;
    double sample_rate = 0;
    std::string data_dir;
    std::string secret; ///< 인자로 출력하지 않는다

    SF_RECORD(SF_FLAG(listen_addr, ",Address to listen on,0.0.0.0"),
              SF_FLAG(port, "port,TCP port to listen on,8080"),
              SF_JSON(verbose, "verbose,omitempty"),
              SF_FLAG(read_timeout, "read_timeout,Per-request read `timeout`,30s"),
              SF_FLAG(max_body_bytes, "max-body,Largest accepted request body,1048576"),
              SF_FLAG(sample_rate, "sample-rate,Fraction of requests to trace,0.01"),
              SF_JSON(data_dir, "data_dir"),
              SF_FLAG(secret, "-"))
};
