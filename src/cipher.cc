
#include <fstream>
#include <memory>
#include <string.h>
#include <unistd.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/err.h>
#include <openssl/crypto.h>

#include "cipher.h"
#include "util_generic.h"
#include "globals.h"
#include "exception.h"
#include "debug.h"

#define CIPHER_BUFSIZE (64 * 1024)

typedef unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> cipherContext;


string opensslError() {
    char buffer[256];
    auto code = ERR_get_error();

    if (!code)
        return "";

    ERR_error_string_n(code, buffer, sizeof(buffer));
    ERR_clear_error();
    return string(" (") + buffer + ")";
}


/*******************************************************************************
 * deriveKey(passphrase, salt, iterations, key, iv)
 *
 * PBKDF2-HMAC-SHA256 producing key and IV in one 48 byte run, the same
 * derivation openssl enc -pbkdf2 uses.
 *******************************************************************************/
bool deriveKey(const string &passphrase, const unsigned char *salt, int iterations, const EVP_CIPHER *cipher,
               unsigned char *key, unsigned char *iv) {
    int keyLen = EVP_CIPHER_key_length(cipher);
    int ivLen = EVP_CIPHER_iv_length(cipher);
    unsigned char derived[EVP_MAX_KEY_LENGTH + EVP_MAX_IV_LENGTH];

    if (!PKCS5_PBKDF2_HMAC(passphrase.c_str(), (int)passphrase.length(), salt, SALT_LEN, iterations,
                           EVP_sha256(), keyLen + ivLen, derived))
        return false;

    memcpy(key, derived, keyLen);
    memcpy(iv, derived + keyLen, ivLen);
    OPENSSL_cleanse(derived, sizeof(derived));
    return true;
}


void encryptFile(string inFile, string outFile, string passphrase, int iterations) {
    const EVP_CIPHER *cipher = EVP_aes_256_cbc();
    unsigned char salt[SALT_LEN];
    unsigned char key[EVP_MAX_KEY_LENGTH];
    unsigned char iv[EVP_MAX_IV_LENGTH];

    DEBUG(D_crypto) DFMT(inFile << " -> " << outFile << " (" << iterations << " iterations)");

    if (cipher == NULL)
        throw VBException("AES-256-CBC is not available from this OpenSSL build", eEncryptionFailed);

    if (!passphrase.length())
        throw VBException("no encryption passphrase configured", eEncryptionFailed);

    ifstream plain(inFile, ios::binary);
    if (!plain.is_open())
        throw VBException("unable to read " + inFile + errtext(), eEncryptionFailed);

    ofstream sealed(outFile, ios::binary | ios::trunc);
    if (!sealed.is_open())
        throw VBException("unable to create " + outFile + errtext(), eEncryptionFailed);

    auto failed = [&](string reason) {
        sealed.close();
        unlink(outFile.c_str());
        OPENSSL_cleanse(key, sizeof(key));
        return VBException("encryption failed: " + reason + opensslError(), eEncryptionFailed);
    };

    if (RAND_bytes(salt, sizeof(salt)) != 1)
        throw failed("unable to generate salt");

    if (!deriveKey(passphrase, salt, iterations, cipher, key, iv))
        throw failed("key derivation failed");

    cipherContext ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx || EVP_EncryptInit_ex(ctx.get(), cipher, NULL, key, iv) != 1)
        throw failed("unable to initialize cipher");

    sealed.write(SALT_MAGIC, strlen(SALT_MAGIC));
    sealed.write((const char*)salt, sizeof(salt));

    unique_ptr<unsigned char[]> inBuf(new unsigned char[CIPHER_BUFSIZE]);
    unique_ptr<unsigned char[]> outBuf(new unsigned char[CIPHER_BUFSIZE + EVP_MAX_BLOCK_LENGTH]);
    int outLen;

    while (plain) {
        plain.read((char*)inBuf.get(), CIPHER_BUFSIZE);
        auto bytesRead = plain.gcount();

        if (bytesRead <= 0)
            break;

        if (EVP_EncryptUpdate(ctx.get(), outBuf.get(), &outLen, inBuf.get(), (int)bytesRead) != 1)
            throw failed("cipher update failed");

        sealed.write((const char*)outBuf.get(), outLen);
    }

    if (plain.bad())
        throw failed("read error on " + inFile);

    if (EVP_EncryptFinal_ex(ctx.get(), outBuf.get(), &outLen) != 1)
        throw failed("cipher finalization failed");

    sealed.write((const char*)outBuf.get(), outLen);
    sealed.flush();

    if (!sealed.good())
        throw failed("write error on " + outFile + errtext());

    sealed.close();
    OPENSSL_cleanse(key, sizeof(key));
}


void decryptStream(string inFile, string passphrase, int iterations, decryptSink sink, bool expectGzip) {
    const EVP_CIPHER *cipher = EVP_aes_256_cbc();
    unsigned char key[EVP_MAX_KEY_LENGTH];
    unsigned char iv[EVP_MAX_IV_LENGTH];
    char header[SALT_LEN * 2];
    unsigned char head[2];
    size_t headLen = 0;

    DEBUG(D_crypto) DFMT(inFile << " (" << iterations << " iterations" << (expectGzip ? ", gzip payload" : "") << ")");

    if (cipher == NULL)
        throw VBException("AES-256-CBC is not available from this OpenSSL build", eEncryptionFailed);

    ifstream sealed(inFile, ios::binary);
    if (!sealed.is_open())
        throw VBException("unable to read " + inFile + errtext(), eDecryptionFailed);

    auto failed = [&](string reason) {
        OPENSSL_cleanse(key, sizeof(key));
        return VBException("decryption failed: " + reason + opensslError(), eDecryptionFailed);
    };

    sealed.read(header, sizeof(header));
    if (sealed.gcount() != sizeof(header) || memcmp(header, SALT_MAGIC, strlen(SALT_MAGIC)))
        throw failed(inFile + " is not an encrypted snapshot (missing salt header)");

    if (!deriveKey(passphrase, (const unsigned char*)header + SALT_LEN, iterations, cipher, key, iv))
        throw failed("key derivation failed");

    cipherContext ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx || EVP_DecryptInit_ex(ctx.get(), cipher, NULL, key, iv) != 1)
        throw failed("unable to initialize cipher");

    // hand plaintext on, checking the first two bytes are the gzip magic
    auto deliver = [&](const unsigned char *data, int length) {
        for (int i = 0; expectGzip && headLen < sizeof(head) && i < length; ++i)
            head[headLen++] = data[i];

        if (expectGzip && headLen == sizeof(head) && (head[0] != 0x1f || head[1] != 0x8b))
            throw failed("wrong passphrase or corrupted snapshot (payload is not an archive)");

        if (length && !sink(data, length))
            throw failed("unable to pass on decrypted data");
    };

    unique_ptr<unsigned char[]> inBuf(new unsigned char[CIPHER_BUFSIZE]);
    unique_ptr<unsigned char[]> outBuf(new unsigned char[CIPHER_BUFSIZE + EVP_MAX_BLOCK_LENGTH]);
    int outLen;

    while (sealed) {
        sealed.read((char*)inBuf.get(), CIPHER_BUFSIZE);
        auto bytesRead = sealed.gcount();

        if (bytesRead <= 0)
            break;

        if (EVP_DecryptUpdate(ctx.get(), outBuf.get(), &outLen, inBuf.get(), (int)bytesRead) != 1)
            throw failed("cipher update failed");

        deliver(outBuf.get(), outLen);
    }

    if (sealed.bad())
        throw failed("read error on " + inFile);

    if (EVP_DecryptFinal_ex(ctx.get(), outBuf.get(), &outLen) != 1)
        throw failed("wrong passphrase or corrupted snapshot (bad padding)");

    deliver(outBuf.get(), outLen);

    if (expectGzip && headLen < sizeof(head))
        throw failed("wrong passphrase or corrupted snapshot (payload is not an archive)");

    OPENSSL_cleanse(key, sizeof(key));
}


void decryptFile(string inFile, string outFile, string passphrase, int iterations, bool expectGzip) {
    ofstream plain(outFile, ios::binary | ios::trunc);

    if (!plain.is_open())
        throw VBException("unable to create " + outFile + errtext(), eDecryptionFailed);

    try {
        decryptStream(inFile, passphrase, iterations, [&](const unsigned char *data, size_t length) {
            plain.write((const char*)data, length);
            return plain.good();
        }, expectGzip);

        plain.close();
        if (plain.fail())
            throw VBException("write error on " + outFile + errtext(), eDecryptionFailed);
    }
    catch (VBException &) {
        plain.close();
        unlink(outFile.c_str());
        throw;
    }
}


string writeChecksumFile(string artifact, string checksumFile) {
    auto digest = sha256File(artifact);

    if (!digest.length())
        throw VBException("unable to hash " + artifact + errtext(), eChecksumFailed);

    ofstream companion(checksumFile, ios::trunc);
    if (!companion.is_open())
        throw VBException("unable to create " + checksumFile + errtext(), eChecksumFailed);

    companion << digest << "\n";
    companion.close();

    if (companion.fail()) {
        unlink(checksumFile.c_str());
        throw VBException("unable to write " + checksumFile + errtext(), eChecksumFailed);
    }

    DEBUG(D_crypto) DFMT(pathSplit(artifact).file << " sha256 " << digest);
    return digest;
}


string readChecksumFile(string checksumFile) {
    ifstream companion(checksumFile);
    string digest;

    if (companion.is_open()) {
        companion >> digest;
        companion.close();
    }

    // sha256sum style "<hex>  <name>" lines only need the first token
    for (auto &c: digest) c = tolower((unsigned char)c);
    return digest;
}

