#ifndef WZB_CLI_HPP
#define WZB_CLI_HPP

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "../common/config.hpp"
#include "../crypto/crypto_provider.hpp"
#include "../network/transport.hpp"

class CLI {
public:
    // A null transport means a real HttpClient built from the configuration.
    explicit CLI(ClientConfig config, std::shared_ptr<Transport> transport = nullptr,
                 std::ostream& out = std::cout);

    // Returns the process exit code.
    int run(const std::string& command, const std::vector<std::string>& args);

    static void print_help(std::ostream& out);

private:
    void cmd_sign(const std::vector<std::string>& args);
    void cmd_decrypt(const std::vector<std::string>& args);
    void cmd_pubkey(const std::vector<std::string>& args);
    void cmd_post(const std::vector<std::string>& args);

    ClientConfig config_;
    std::shared_ptr<SmCryptoProvider> crypto_;
    std::shared_ptr<Transport> transport_;
    std::ostream& out_;
};

// Reads a JSON object from a file, keeping key order.
FieldMap read_body_file(const std::string& path);

#endif // WZB_CLI_HPP
