
#ifndef EXCEPTION_H
#define EXCEPTION_H

#include <string>

using namespace std;


enum errorKind { eGeneric, eConfig, eAlreadyRunning, eInsufficientSpace, eArchiveFailed, eEncryptionFailed,
    eChecksumFailed, eUploadFailed, eDownloadFailed, eDecryptionFailed, eExtractFailed };


class VBException : public std::exception {
    string message;
    errorKind kind;

public:
    VBException(string msg) : message(msg), kind(eGeneric) {}
    VBException(string msg, errorKind k) : message(msg), kind(k) {}

    string detail() const { return message; }
    errorKind getKind() const { return kind; }
    const char *what() const noexcept { return message.c_str(); }
};


string errorKindName(errorKind kind);

#endif

