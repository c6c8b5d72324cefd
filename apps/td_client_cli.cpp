// SPDX-License-Identifier: MIT
// Part of TrustDial (TD) project.
// apps/td_client_cli.cpp

#include "td/basic_auth.hpp"
#include "td/dial_gate.hpp"
#include "td/http_client.hpp"
#include "td/http_response.hpp"
#include "td/series.hpp"

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <algorithm>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " --url https://host[:port]/path "
      "[--method GET|POST|...] [--data STRING] [--insecure 0|1] [--ca ca.pem ...] "
      "[--local-only 0|1] [--user NAME --password PASS] [--log FILE]\n"
      "\n"
      "Timeouts:\n"
      "  --connect_timeout <sec>   TCP connect timeout in seconds (default 5)\n"
      "  --io_timeout <sec>        per-op I/O timeout in seconds (default 5)\n"
      "\n"
      "  --ca may be repeated; each file may hold several PEM certificates.\n"
      "  --local-only 1 refuses every non-loopback destination.\n";
}

static bool read_file(const std::string& path, std::string& out){
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.good()) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

int main(int argc, char** argv){
    td::ClientConfig cfg;
    cfg.connect_timeout_sec = 5;
    cfg.io_timeout_sec      = 5;
    cfg.log_file.clear();   // stdout only unless --log is given

    std::string url, method = "GET", data, user, password;
    bool have_user = false;
    bool insecure = false;
    bool local_only = false;
    std::vector<std::string> ca_files;

    for(int i=1;i<argc;++i){
        std::string a=argv[i];
        if(a=="--url" && i+1<argc) url = argv[++i];
        else if(a=="--method" && i+1<argc) method = argv[++i];
        else if(a=="--data" && i+1<argc) data = argv[++i];
        else if(a=="--insecure" && i+1<argc) insecure = (std::stoi(argv[++i])!=0);
        else if(a=="--ca" && i+1<argc) ca_files.push_back(argv[++i]);
        else if(a=="--local-only" && i+1<argc) local_only = (std::stoi(argv[++i])!=0);
        else if(a=="--user" && i+1<argc) { user = argv[++i]; have_user = true; }
        else if(a=="--password" && i+1<argc) password = argv[++i];
        else if(a=="--log" && i+1<argc) cfg.log_file = argv[++i];
        else if(a=="--connect_timeout" && i+1<argc) cfg.connect_timeout_sec = std::max(1, std::stoi(argv[++i]));
        else if(a=="--io_timeout" && i+1<argc)      cfg.io_timeout_sec      = std::max(1, std::stoi(argv[++i]));
        else { usage(argv[0]); return 2; }
    }
    if (url.empty()) { usage(argv[0]); return 2; }
    if (have_user && user.find(':') != std::string::npos) {
        std::cerr << "Bad --user: must not contain ':'\n";
        return 2;
    }

    std::vector<std::string> certs;
    for (const auto& f : ca_files) {
        std::string pem;
        if (!read_file(f, pem)) {
            std::cerr << "cannot read CA file " << f << "\n";
            return 2;
        }
        certs.push_back(std::move(pem));
    }

    std::string series;
    td::Error series_err;
    if (!td::host_series(series, &series_err)) {
        std::cerr << "warning: " << series_err.message << "\n";
    }
    cfg.user_agent = "td-client/1 (" + series + ")";

    if (local_only) {
        td::set_outgoing_access_allowed(false);
    }

    auto cli = td::get_http_client(insecure ? td::SslHostnameVerification::NoVerify
                                            : td::SslHostnameVerification::Verify,
                                   certs, /*gate*/nullptr, cfg);
    if (!certs.empty() && cli->tls_config().root_cas && cli->tls_config().root_cas->empty()) {
        std::cerr << "warning: no valid certificate in --ca input; custom trust pool is empty\n";
    }

    td::HttpHeaders headers;
    if (have_user) headers = td::basic_auth_header(user, password);

    td::HttpResponse resp;
    td::Error err;
    if(!cli->request(method, url, headers, data, resp, &err)){
        std::cerr << "request failed (" << td::errc_name(err.code) << "): " << err.message << "\n";
        return 1;
    }
    std::cout<<"HTTP "<<resp.status_code<<" "<<resp.status_text<<"\n";
    for (auto& kv: resp.headers){
        std::cout<<kv.first<<": "<<kv.second<<"\n";
    }
    std::cout<<"\n"<<resp.body<<"\n";
    return 0;
}
