#include "IdentityLoader.hpp"
#include "../core/Console.hpp"
#include "../core/Errors.hpp"
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pkcs12.h>
#include <openssl/provider.h>
#include <mutex>
#include <vector>

namespace devsim {

namespace {

/// Nested safe-contents bags deeper than this are ignored
constexpr int kMaxBagNesting = 4;

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free_all(bio); }
};

struct Pkcs12Deleter {
    void operator()(PKCS12* p12) const { PKCS12_free(p12); }
};

struct Pkcs7StackDeleter {
    void operator()(STACK_OF(PKCS7)* safes) const { sk_PKCS7_pop_free(safes, PKCS7_free); }
};

struct SafeBagStackDeleter {
    void operator()(STACK_OF(PKCS12_SAFEBAG)* bags) const {
        sk_PKCS12_SAFEBAG_pop_free(bags, PKCS12_SAFEBAG_free);
    }
};

struct Pkcs8Deleter {
    void operator()(PKCS8_PRIV_KEY_INFO* p8) const { PKCS8_PRIV_KEY_INFO_free(p8); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using Pkcs12Ptr = std::unique_ptr<PKCS12, Pkcs12Deleter>;
using Pkcs7StackPtr = std::unique_ptr<STACK_OF(PKCS7), Pkcs7StackDeleter>;
using SafeBagStackPtr = std::unique_ptr<STACK_OF(PKCS12_SAFEBAG), SafeBagStackDeleter>;
using Pkcs8Ptr = std::unique_ptr<PKCS8_PRIV_KEY_INFO, Pkcs8Deleter>;

/// Everything decoded from a bundle; entries not moved out are freed with it
struct BundleContents {
    std::vector<X509Ptr> certificates;
    std::vector<EvpPkeyPtr> keys;
};

struct Password {
    const char* data;
    int length;
};

std::string takeOpenSslError() {
    unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) {
        return "unknown error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

// Windows exported bundles commonly use RC2/3DES, which OpenSSL 3 only
// provides through the legacy provider. Its absence is not fatal.
void loadLegacyProvider() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (OSSL_PROVIDER_try_load(nullptr, "legacy", 1) == nullptr) {
            ERR_clear_error();
        }
    });
}

void collectBags(const STACK_OF(PKCS12_SAFEBAG)* bags, const Password& password,
                 BundleContents& contents, int depth) {
    for (int i = 0; i < sk_PKCS12_SAFEBAG_num(bags); ++i) {
        const PKCS12_SAFEBAG* bag = sk_PKCS12_SAFEBAG_value(bags, i);

        switch (PKCS12_SAFEBAG_get_nid(bag)) {
            case NID_certBag: {
                if (PKCS12_SAFEBAG_get_bag_nid(bag) != NID_x509Certificate) {
                    break;
                }
                X509Ptr cert(PKCS12_SAFEBAG_get1_cert(bag));
                if (!cert) {
                    throw CredentialError("Malformed certificate entry: " + takeOpenSslError());
                }
                contents.certificates.push_back(std::move(cert));
                break;
            }
            case NID_keyBag: {
                EvpPkeyPtr key(EVP_PKCS82PKEY(PKCS12_SAFEBAG_get0_p8inf(bag)));
                if (!key) {
                    throw CredentialError("Malformed private key entry: " + takeOpenSslError());
                }
                contents.keys.push_back(std::move(key));
                break;
            }
            case NID_pkcs8ShroudedKeyBag: {
                Pkcs8Ptr p8(PKCS12_decrypt_skey(bag, password.data, password.length));
                if (!p8) {
                    throw CredentialError("Failed to decrypt private key entry: " + takeOpenSslError());
                }
                EvpPkeyPtr key(EVP_PKCS82PKEY(p8.get()));
                if (!key) {
                    throw CredentialError("Malformed private key entry: " + takeOpenSslError());
                }
                contents.keys.push_back(std::move(key));
                break;
            }
            case NID_safeContentsBag:
                if (depth < kMaxBagNesting) {
                    collectBags(PKCS12_SAFEBAG_get0_safes(bag), password, contents, depth + 1);
                }
                break;
            default:
                // CRL and secret bags carry no identity material
                break;
        }
    }
}

BundleContents decodeBundle(PKCS12* p12, const Password& password) {
    Pkcs7StackPtr safes(PKCS12_unpack_authsafes(p12));
    if (!safes) {
        throw CredentialError("Failed to unpack bundle contents: " + takeOpenSslError());
    }

    BundleContents contents;
    for (int i = 0; i < sk_PKCS7_num(safes.get()); ++i) {
        PKCS7* safe = sk_PKCS7_value(safes.get(), i);

        SafeBagStackPtr bags;
        int nid = OBJ_obj2nid(safe->type);
        if (nid == NID_pkcs7_data) {
            bags.reset(PKCS12_unpack_p7data(safe));
        } else if (nid == NID_pkcs7_encrypted) {
            bags.reset(PKCS12_unpack_p7encdata(safe, password.data, password.length));
        } else {
            continue;
        }

        if (!bags) {
            throw CredentialError("Failed to decrypt bundle contents: " + takeOpenSslError());
        }
        collectBags(bags.get(), password, contents, 0);
    }
    return contents;
}

} // namespace

Identity IdentityLoader::loadIdentity(const std::string& bundlePath,
                                      const std::string& bundlePassword,
                                      const EntryObserver& observer) {
    loadLegacyProvider();

    BioPtr bio(BIO_new_file(bundlePath.c_str(), "rb"));
    if (!bio) {
        ERR_clear_error();
        throw CredentialError("Cannot open credential bundle: " + bundlePath);
    }

    Pkcs12Ptr p12(d2i_PKCS12_bio(bio.get(), nullptr));
    if (!p12) {
        throw CredentialError(bundlePath + " is not a PKCS#12 bundle: " + takeOpenSslError());
    }

    Password password{bundlePassword.c_str(), static_cast<int>(bundlePassword.size())};
    if (PKCS12_mac_present(p12.get())) {
        if (PKCS12_verify_mac(p12.get(), password.data, password.length) != 1) {
            // An empty password may have been encoded as an absent one
            if (!bundlePassword.empty() || PKCS12_verify_mac(p12.get(), nullptr, 0) != 1) {
                ERR_clear_error();
                throw CredentialError("Invalid password for credential bundle: " + bundlePath);
            }
            password = Password{nullptr, 0};
        }
    }

    BundleContents contents = decodeBundle(p12.get(), password);

    // Report every certificate before selecting, then keep the first match
    constexpr std::size_t kNoMatch = static_cast<std::size_t>(-1);
    std::size_t selectedCert = kNoMatch;
    std::size_t selectedKey = kNoMatch;

    for (std::size_t i = 0; i < contents.certificates.size(); ++i) {
        const X509* cert = contents.certificates[i].get();

        std::size_t keyIndex = kNoMatch;
        for (std::size_t k = 0; k < contents.keys.size(); ++k) {
            if (X509_check_private_key(cert, contents.keys[k].get()) == 1) {
                keyIndex = k;
                break;
            }
        }
        ERR_clear_error();

        CertificateEntry entry;
        entry.thumbprint = certificateThumbprint(cert);
        entry.subject = certificateSubject(cert);
        entry.hasPrivateKey = keyIndex != kNoMatch;

        console::info("[Identity] Found certificate: " + entry.thumbprint + " " + entry.subject +
                      "; PrivateKey: " + (entry.hasPrivateKey ? "True" : "False"));
        if (observer) {
            observer(entry);
        }

        if (selectedCert == kNoMatch && entry.hasPrivateKey) {
            selectedCert = i;
            selectedKey = keyIndex;
        }
    }

    if (selectedCert == kNoMatch) {
        throw CredentialError(bundlePath + " did not contain any certificate with a private key.");
    }

    Identity identity(std::move(contents.certificates[selectedCert]),
                      std::move(contents.keys[selectedKey]));

    console::highlight("[Identity] Using certificate " + identity.thumbprint() + " " + identity.subject());
    return identity;
}

} // namespace devsim
