#include "X509Credential.hpp"
#include "../core/Console.hpp"
#include "../core/Errors.hpp"
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace devsim {

namespace fs = std::filesystem;

namespace {

constexpr int kDirectoryAttempts = 8;

std::string randomSuffix() {
    std::random_device rd;
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(8) << rd() << std::setw(8) << rd();
    return ss.str();
}

} // namespace

X509Credential::X509Credential(std::shared_ptr<const Identity> identity,
                               std::string rootCaPath,
                               bool verifyServer)
    : identity_(std::move(identity))
    , rootCaPath_(std::move(rootCaPath))
    , verifyServer_(verifyServer) {
    if (!identity_) {
        throw CredentialError("X509Credential requires an identity");
    }

    directory_ = createPrivateDirectory();
    try {
        materialize();
    } catch (const std::exception&) {
        std::error_code ec;
        fs::remove_all(directory_, ec);
        throw;
    }
}

X509Credential::~X509Credential() {
    std::error_code ec;
    fs::remove_all(directory_, ec);
    if (ec) {
        console::error("[Identity] Failed to remove credential directory " +
                       directory_.string() + ": " + ec.message());
    }
}

TlsConfig X509Credential::tlsConfig() const {
    TlsConfig config;
    config.certPath = (directory_ / kCertificateFile).string();
    config.keyPath = (directory_ / kPrivateKeyFile).string();
    config.caPath = rootCaPath_;
    config.verifyServer = verifyServer_;
    return config;
}

void X509Credential::materialize() {
    writeFile(directory_ / kCertificateFile, identity_->certificatePem());
    writeFile(directory_ / kPrivateKeyFile, identity_->privateKeyPem());
}

fs::path X509Credential::createPrivateDirectory() {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        throw CredentialError("No temporary directory available: " + ec.message());
    }

    for (int attempt = 0; attempt < kDirectoryAttempts; ++attempt) {
        fs::path candidate = base / ("devsim-" + randomSuffix());
        if (!fs::create_directory(candidate, ec)) {
            if (ec) {
                throw CredentialError("Cannot create credential directory " +
                                      candidate.string() + ": " + ec.message());
            }
            continue; // name already taken
        }

        fs::permissions(candidate, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(candidate, ignored);
            throw CredentialError("Cannot restrict credential directory: " + ec.message());
        }
        return candidate;
    }

    throw CredentialError("Cannot create a unique credential directory under " + base.string());
}

void X509Credential::writeFile(const fs::path& path, const std::string& contents) {
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw CredentialError("Cannot write " + path.string());
        }
        out << contents;
        if (!out.flush()) {
            throw CredentialError("Cannot write " + path.string());
        }
    }

    std::error_code ec;
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
        throw CredentialError("Cannot restrict " + path.string() + ": " + ec.message());
    }
}

} // namespace devsim
