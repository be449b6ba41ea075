#include "TestCertificates.hpp"
#include <openssl/bio.h>
#include <openssl/ec.h>
#include <openssl/pkcs12.h>
#include <cstring>
#include <memory>
#include <random>
#include <stdexcept>

namespace devsim::test {

namespace {

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free_all(bio); }
};

struct Pkcs12Deleter {
    void operator()(PKCS12* p12) const { PKCS12_free(p12); }
};

void check(bool ok, const char* what) {
    if (!ok) {
        throw std::runtime_error(std::string("OpenSSL failure: ") + what);
    }
}

} // namespace

EvpPkeyPtr generateKey() {
    EvpPkeyPtr key(EVP_EC_gen("P-256"));
    check(key != nullptr, "EVP_EC_gen");
    return key;
}

X509Ptr makeCertificate(const EVP_PKEY* key, const std::string& commonName) {
    static long serial = 1;

    X509Ptr cert(X509_new());
    check(cert != nullptr, "X509_new");

    check(X509_set_version(cert.get(), 2) == 1, "X509_set_version");
    check(ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), serial++) == 1, "serial");
    check(X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0) != nullptr, "notBefore");
    check(X509_gmtime_adj(X509_getm_notAfter(cert.get()), 60L * 60 * 24) != nullptr, "notAfter");
    check(X509_set_pubkey(cert.get(), const_cast<EVP_PKEY*>(key)) == 1, "X509_set_pubkey");

    X509_NAME* name = X509_get_subject_name(cert.get());
    check(X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
                                     reinterpret_cast<const unsigned char*>("Device Simulator Tests"),
                                     -1, -1, 0) == 1, "O");
    check(X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                     reinterpret_cast<const unsigned char*>(commonName.c_str()),
                                     -1, -1, 0) == 1, "CN");
    check(X509_set_issuer_name(cert.get(), name) == 1, "X509_set_issuer_name");

    check(X509_sign(cert.get(), const_cast<EVP_PKEY*>(key), EVP_sha256()) > 0, "X509_sign");
    return cert;
}

void writeBundle(const std::filesystem::path& path, const std::vector<BundleEntry>& entries,
                 const std::string& password) {
    const char* pass = password.c_str();

    STACK_OF(PKCS12_SAFEBAG)* certBags = nullptr;
    STACK_OF(PKCS12_SAFEBAG)* keyBags = nullptr;
    STACK_OF(PKCS7)* safes = nullptr;

    for (const auto& entry : entries) {
        X509* cert = const_cast<X509*>(entry.certificate);
        PKCS12_SAFEBAG* certBag = PKCS12_add_cert(&certBags, cert);
        check(certBag != nullptr, "PKCS12_add_cert");

        if (entry.key != nullptr) {
            PKCS12_SAFEBAG* keyBag = PKCS12_add_key(&keyBags, const_cast<EVP_PKEY*>(entry.key), 0,
                                                    PKCS12_DEFAULT_ITER, NID_aes_256_cbc, pass);
            check(keyBag != nullptr, "PKCS12_add_key");

            unsigned char keyId[EVP_MAX_MD_SIZE];
            unsigned int keyIdLength = 0;
            check(X509_digest(cert, EVP_sha1(), keyId, &keyIdLength) == 1, "X509_digest");
            check(PKCS12_add_localkeyid(certBag, keyId, static_cast<int>(keyIdLength)) == 1, "localKeyId");
            check(PKCS12_add_localkeyid(keyBag, keyId, static_cast<int>(keyIdLength)) == 1, "localKeyId");
        }
    }

    check(PKCS12_add_safe(&safes, certBags, NID_aes_256_cbc, PKCS12_DEFAULT_ITER, pass) == 1,
          "PKCS12_add_safe(certs)");
    sk_PKCS12_SAFEBAG_pop_free(certBags, PKCS12_SAFEBAG_free);

    if (keyBags != nullptr) {
        check(PKCS12_add_safe(&safes, keyBags, -1, 0, nullptr) == 1, "PKCS12_add_safe(keys)");
        sk_PKCS12_SAFEBAG_pop_free(keyBags, PKCS12_SAFEBAG_free);
    }

    std::unique_ptr<PKCS12, Pkcs12Deleter> p12(PKCS12_add_safes(safes, 0));
    sk_PKCS7_pop_free(safes, PKCS7_free);
    check(p12 != nullptr, "PKCS12_add_safes");
    check(PKCS12_set_mac(p12.get(), pass, -1, nullptr, 0, PKCS12_DEFAULT_ITER, nullptr) == 1,
          "PKCS12_set_mac");

    std::unique_ptr<BIO, BioDeleter> bio(BIO_new_file(path.string().c_str(), "wb"));
    check(bio != nullptr, "BIO_new_file");
    check(i2d_PKCS12_bio(bio.get(), p12.get()) == 1, "i2d_PKCS12_bio");
}

TempDir::TempDir() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("devsim-test-" + std::to_string(rd()) + std::to_string(rd()));
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::filesystem::path writeDeviceBundle(const TempDir& dir, const std::string& commonName,
                                        const std::string& password) {
    EvpPkeyPtr key = generateKey();
    X509Ptr cert = makeCertificate(key.get(), commonName);

    std::filesystem::path path = dir.file(commonName + ".pfx");
    writeBundle(path, {BundleEntry{cert.get(), key.get()}}, password);
    return path;
}

} // namespace devsim::test
