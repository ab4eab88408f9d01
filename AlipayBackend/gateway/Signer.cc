#include "Signer.h"
#include <drogon/utils/Utilities.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

namespace alipay
{
namespace
{
const EVP_MD *digestFor(const std::string &signType)
{
    if (signType == "RSA2")
    {
        return EVP_sha256();
    }
    if (signType == "RSA")
    {
        return EVP_sha1();
    }
    return nullptr;
}

std::string wrapPem(const std::string &key, const char *label)
{
    std::string body;
    for (char c : key)
    {
        if (c != '\r' && c != '\n' && c != ' ' && c != '\t')
        {
            body.push_back(c);
        }
    }
    std::string pem = std::string("-----BEGIN ") + label + "-----\n";
    for (size_t i = 0; i < body.size(); i += 64)
    {
        pem += body.substr(i, 64);
        pem.push_back('\n');
    }
    pem += std::string("-----END ") + label + "-----\n";
    return pem;
}

bool isPem(const std::string &key)
{
    return key.find("-----BEGIN") != std::string::npos;
}

EVP_PKEY *readPrivateKeyPem(const std::string &pem)
{
    BIO *bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio)
    {
        return nullptr;
    }
    EVP_PKEY *pkey = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    return pkey;
}

EVP_PKEY *loadPrivateKey(const std::string &key)
{
    if (isPem(key))
    {
        return readPrivateKeyPem(key);
    }
    EVP_PKEY *pkey = readPrivateKeyPem(wrapPem(key, "PRIVATE KEY"));
    if (!pkey)
    {
        pkey = readPrivateKeyPem(wrapPem(key, "RSA PRIVATE KEY"));
    }
    return pkey;
}

EVP_PKEY *loadPublicKey(const std::string &key)
{
    const std::string pem = isPem(key) ? key : wrapPem(key, "PUBLIC KEY");
    BIO *bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio)
    {
        return nullptr;
    }

    EVP_PKEY *pkey = nullptr;
    if (pem.find("-----BEGIN CERTIFICATE") != std::string::npos)
    {
        X509 *cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
        if (cert)
        {
            pkey = X509_get_pubkey(cert);
            X509_free(cert);
        }
    }
    else
    {
        pkey = PEM_read_bio_PUBKEY(bio, nullptr, nullptr, nullptr);
    }
    BIO_free(bio);
    return pkey;
}
}  // namespace

bool Signer::isSupportedSignType(const std::string &signType)
{
    return digestFor(signType) != nullptr;
}

bool Signer::sign(const std::string &content,
                  const std::string &privateKey,
                  const std::string &signType,
                  std::string &signatureB64,
                  std::string &error)
{
    const EVP_MD *md = digestFor(signType);
    if (!md)
    {
        error = "unsupported sign_type: " + signType;
        return false;
    }
    if (privateKey.empty())
    {
        error = "private key is not configured";
        return false;
    }

    EVP_PKEY *pkey = loadPrivateKey(privateKey);
    if (!pkey)
    {
        error = "failed to load private key";
        return false;
    }

    EVP_MD_CTX *ctx = EVP_MD_CTX_new();
    if (!ctx)
    {
        EVP_PKEY_free(pkey);
        error = "failed to create EVP_MD_CTX";
        return false;
    }

    if (EVP_DigestSignInit(ctx, nullptr, md, nullptr, pkey) != 1)
    {
        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        error = "EVP_DigestSignInit failed";
        return false;
    }

    if (EVP_DigestSignUpdate(ctx, content.data(), content.size()) != 1)
    {
        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        error = "EVP_DigestSignUpdate failed";
        return false;
    }

    size_t sigLen = 0;
    if (EVP_DigestSignFinal(ctx, nullptr, &sigLen) != 1)
    {
        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        error = "EVP_DigestSignFinal size failed";
        return false;
    }

    std::string signature(sigLen, '\0');
    if (EVP_DigestSignFinal(ctx,
                            reinterpret_cast<unsigned char *>(&signature[0]),
                            &sigLen) != 1)
    {
        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        error = "EVP_DigestSignFinal failed";
        return false;
    }

    signature.resize(sigLen);
    signatureB64 = drogon::utils::base64Encode(signature);

    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);
    return true;
}

bool Signer::verify(const std::string &content,
                    const std::string &signatureB64,
                    const std::string &publicKey,
                    const std::string &signType,
                    std::string &error)
{
    const EVP_MD *md = digestFor(signType);
    if (!md)
    {
        error = "unsupported sign_type: " + signType;
        return false;
    }
    if (signatureB64.empty())
    {
        error = "missing signature";
        return false;
    }
    if (publicKey.empty())
    {
        error = "alipay public key is not configured";
        return false;
    }

    EVP_PKEY *pkey = loadPublicKey(publicKey);
    if (!pkey)
    {
        error = "failed to load public key";
        return false;
    }

    // Canonical padded base64 only; base64Decode skips trailing garbage.
    auto signature = drogon::utils::base64Decode(signatureB64);
    if (signature.empty() || signatureB64.size() % 4 != 0 ||
        drogon::utils::base64Encode(signature) != signatureB64)
    {
        EVP_PKEY_free(pkey);
        error = "failed to decode signature";
        return false;
    }

    EVP_MD_CTX *ctx = EVP_MD_CTX_new();
    if (!ctx)
    {
        EVP_PKEY_free(pkey);
        error = "failed to create EVP_MD_CTX";
        return false;
    }

    if (EVP_DigestVerifyInit(ctx, nullptr, md, nullptr, pkey) != 1)
    {
        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        error = "EVP_DigestVerifyInit failed";
        return false;
    }

    if (EVP_DigestVerifyUpdate(ctx, content.data(), content.size()) != 1)
    {
        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        error = "EVP_DigestVerifyUpdate failed";
        return false;
    }

    int ok = EVP_DigestVerifyFinal(
        ctx,
        reinterpret_cast<const unsigned char *>(signature.data()),
        signature.size());
    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);

    if (ok != 1)
    {
        ERR_clear_error();
        error = "signature verify failed";
        return false;
    }
    return true;
}

bool Signer::verify(const std::string &content,
                    const std::string &signatureB64,
                    const std::string &publicKey,
                    const std::string &signType)
{
    std::string error;
    return verify(content, signatureB64, publicKey, signType, error);
}
}  // namespace alipay
