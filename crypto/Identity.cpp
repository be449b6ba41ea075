#include "Identity.hpp"
#include "../core/Errors.hpp"
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <iomanip>
#include <sstream>
#include <vector>

namespace devsim {

namespace {

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free_all(bio); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;

std::string drainBio(BIO* bio) {
    char* data = nullptr;
    long length = BIO_get_mem_data(bio, &data);
    if (length <= 0 || data == nullptr) {
        return {};
    }
    return std::string(data, static_cast<std::size_t>(length));
}

} // namespace

std::string certificateThumbprint(const X509* cert) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (X509_digest(cert, EVP_sha1(), digest, &length) != 1) {
        return {};
    }

    std::ostringstream hex;
    hex << std::uppercase << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        hex << std::setw(2) << static_cast<int>(digest[i]);
    }
    return hex.str();
}

std::string certificateSubject(const X509* cert) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        return {};
    }
    X509_NAME_print_ex(bio.get(), X509_get_subject_name(cert), 0, XN_FLAG_RFC2253);
    return drainBio(bio.get());
}

std::string certificateCommonName(const X509* cert) {
    const X509_NAME* name = X509_get_subject_name(cert);
    int length = X509_NAME_get_text_by_NID(name, NID_commonName, nullptr, 0);
    if (length <= 0) {
        return {};
    }

    std::vector<char> buffer(static_cast<std::size_t>(length) + 1);
    X509_NAME_get_text_by_NID(name, NID_commonName, buffer.data(), length + 1);
    return std::string(buffer.data(), static_cast<std::size_t>(length));
}

Identity::Identity(X509Ptr certificate, EvpPkeyPtr privateKey)
    : certificate_(std::move(certificate))
    , privateKey_(std::move(privateKey)) {
    if (!certificate_) {
        throw CredentialError("Identity requires a certificate");
    }
    if (!privateKey_) {
        throw CredentialError("Identity requires a private key");
    }
    if (X509_check_private_key(certificate_.get(), privateKey_.get()) != 1) {
        ERR_clear_error();
        throw CredentialError("Private key does not match certificate");
    }

    thumbprint_ = certificateThumbprint(certificate_.get());
    subject_ = certificateSubject(certificate_.get());
    registrationId_ = certificateCommonName(certificate_.get());

    if (registrationId_.empty()) {
        throw CredentialError("Certificate " + thumbprint_ + " has no subject common name");
    }
}

std::string Identity::certificatePem() const {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_X509(bio.get(), certificate_.get()) != 1) {
        throw CredentialError("Failed to encode certificate as PEM");
    }
    return drainBio(bio.get());
}

std::string Identity::privateKeyPem() const {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PrivateKey(bio.get(), privateKey_.get(),
                                         nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        throw CredentialError("Failed to encode private key as PEM");
    }
    return drainBio(bio.get());
}

} // namespace devsim
