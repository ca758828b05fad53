
#ifndef CIPHER_H
#define CIPHER_H

#include <string>
#include <functional>

using namespace std;

/*
 Snapshot encryption.  The format is the one written by

     openssl enc -aes-256-cbc -salt -pbkdf2 -iter <iterations>

 ("Salted__", 8 random salt bytes, then AES-256-CBC ciphertext with the key
 and IV derived from the passphrase by PBKDF2-HMAC-SHA256) so a snapshot can
 always be recovered with the stock openssl binary as well.
 */

#define SALT_MAGIC "Salted__"
#define SALT_LEN 8
#define DEFAULT_KDF_ITERATIONS 10000

typedef function<bool(const unsigned char *data, size_t length)> decryptSink;

// throws VBException(eEncryptionFailed); outFile is removed on failure
void encryptFile(string inFile, string outFile, string passphrase, int iterations = DEFAULT_KDF_ITERATIONS);

/* decryptStream(inFile, passphrase, iterations, sink, expectGzip)
 * Decrypt inFile handing the plaintext to sink as it's produced.  A bad header,
 * bad padding (the usual result of a wrong passphrase) or, with expectGzip,
 * plaintext that isn't a gzip stream throws VBException(eDecryptionFailed).
 * If sink returns false decryption stops with eDecryptionFailed too. */
void decryptStream(string inFile, string passphrase, int iterations, decryptSink sink, bool expectGzip = true);

// throws VBException(eDecryptionFailed); outFile is removed on failure
void decryptFile(string inFile, string outFile, string passphrase, int iterations = DEFAULT_KDF_ITERATIONS, bool expectGzip = true);

// write "<sha256 hex>\n" for artifact to checksumFile; throws VBException(eChecksumFailed)
string writeChecksumFile(string artifact, string checksumFile);

// the hex digest stored in a checksum companion, "" if unreadable
string readChecksumFile(string checksumFile);

#endif

