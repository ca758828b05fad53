
#include <string>
#include <iostream>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <errno.h>
#include <string.h>
#include <vector>
#include "util_generic.h"
#include "colors.h"
#include "globals.h"
#include "PipeExec.h"
#include "exception.h"
#include "debug.h"


#define READ_END STDIN_FILENO
#define WRITE_END STDOUT_FILENO

using namespace std;


PipeExec::PipeExec(vector<string> command, string name) {
    args = command;
    procName = name.length() ? name : (command.size() ? pathSplit(command[0]).file : "proc");
    childPID = 0;
    writeFd = readFd = -1;
    reaped = false;
    exitStatus = -1;
}


PipeExec::~PipeExec() {
    closeAll();

    if (childPID && !reaped)
        wait();

    if (errorFile.length()) {
        unlink(errorFile.c_str());

        // the per-process directory goes once the last stderr file in it is gone
        rmdir(pathSplit(errorFile).dir.c_str());
    }
}


static void closePipe(int fds[2]) {
    for (int i = 0; i < 2; ++i)
        if (fds[i] >= 0) {
            close(fds[i]);
            fds[i] = -1;
        }
}


string PipeExec::commandLine() {
    string result;

    for (auto &arg: args)
        result += (result.length() ? " " : "") + arg;

    return result;
}


pid_t PipeExec::execute(bool withInput, pipeOutput output) {
    int inPipe[2] = { -1, -1 };
    int outPipe[2] = { -1, -1 };

    if (!args.size())
        throw VBException("no command to execute");

    string errorDir = slashConcat(TMP_OUTPUT_DIR, "pid_" + to_string(getpid()));
    mkdirp(errorDir);

    static unsigned int commandID = 0;
    errorFile = slashConcat(errorDir, to_string(++commandID) + "." + procName + ".stderr");

    DEBUG(D_exec) DFMT("executing [" << (procName == "rclone" || procName == "curl" ? args[0] + " " + (args.size() > 1 ? args[1] : "") + " ..." : commandLine()) << "]");

    if ((withInput && pipe(inPipe)) || (output == poCapture && pipe(outPipe))) {
        string error = "unable to create pipes for " + procName + errtext();
        closePipe(inPipe);
        closePipe(outPipe);
        throw VBException(error);
    }

    if ((childPID = fork()) < 0) {
        childPID = 0;
        string error = "unable to fork for " + procName + errtext();
        closePipe(inPipe);
        closePipe(outPipe);
        throw VBException(error);
    }

    // CHILD
    if (!childPID) {
        if (withInput) {
            close(inPipe[WRITE_END]);
            DUP2(inPipe[READ_END], READ_END);
            close(inPipe[READ_END]);
        }
        else {
            int nullFd = open("/dev/null", O_RDONLY);
            if (nullFd >= 0) {
                DUP2(nullFd, READ_END);
                close(nullFd);
            }
        }

        if (output == poCapture) {
            close(outPipe[READ_END]);
            DUP2(outPipe[WRITE_END], WRITE_END);
            close(outPipe[WRITE_END]);
        }
        else
            if (output == poDiscard) {
                int nullFd = open("/dev/null", O_WRONLY);
                if (nullFd >= 0) {
                    DUP2(nullFd, WRITE_END);
                    close(nullFd);
                }
            }

        // redirect stderr to a file
        int errorFd = open(errorFile.c_str(), O_CREAT | O_WRONLY | O_TRUNC, S_IRUSR | S_IWUSR);
        if (errorFd >= 0) {
            DUP2(errorFd, 2);
            close(errorFd);
        }

        vector<char*> params;
        for (auto &arg: args)
            params.push_back(const_cast<char*>(arg.c_str()));
        params.push_back(NULL);

        execvp(params[0], params.data());
        cerr << "unable to execute " << args[0] << errtext() << endl;
        _exit(127);
    }

    // PARENT
    if (withInput) {
        close(inPipe[READ_END]);
        writeFd = inPipe[WRITE_END];
    }

    if (output == poCapture) {
        close(outPipe[WRITE_END]);
        readFd = outPipe[READ_END];
    }

    reaped = false;
    return childPID;
}


int PipeExec::capture(string &output) {
    execute();
    output = readAll();
    return wait();
}


ssize_t PipeExec::readProc(void *buf, size_t count) {
    ssize_t bytes;

    if (readFd < 0)
        return 0;

    while ((bytes = read(readFd, buf, count)) < 0 && errno == EINTR);
    return bytes;
}


string PipeExec::readAll() {
    string result;
    char buffer[16 * 1024];
    ssize_t bytes;

    while ((bytes = readProc(buffer, sizeof(buffer))) > 0)
        result.append(buffer, bytes);

    closeRead();
    return result;
}


// returns the bytes written or -1 if the child has gone away (EPIPE)
ssize_t PipeExec::writeProc(const void *buf, size_t count) {
    size_t pos = 0;

    if (writeFd < 0)
        return -1;

    while (pos < count) {
        ssize_t bytes = write(writeFd, (const char*)buf + pos, count - pos);

        if (bytes < 0) {
            if (errno == EINTR)
                continue;

            DEBUG(D_exec) DFMT("write to " << procName << " failed" << errtext());
            return -1;
        }

        pos += bytes;
    }

    return pos;
}


ssize_t PipeExec::writeProc(const string &data) {
    return writeProc(data.c_str(), data.length());
}


/*******************************************************************************
 * wait()
 *
 * Reap the child and return its exit status.  A child killed by a signal
 * is reported as 128 + the signal number, the same way a shell would.
 *******************************************************************************/
int PipeExec::wait() {
    if (!childPID)
        return -1;

    if (reaped)
        return exitStatus;

    closeAll();

    int status;
    pid_t result;
    while ((result = waitpid(childPID, &status, 0)) < 0 && errno == EINTR);

    reaped = true;
    if (result < 0)
        exitStatus = -1;
    else
        exitStatus = WIFEXITED(status) ? WEXITSTATUS(status) : WIFSIGNALED(status) ? 128 + WTERMSIG(status) : -1;

    DEBUG(D_exec) DFMT(procName << " (pid " << childPID << ") exited with " << exitStatus);
    return exitStatus;
}


string PipeExec::errorOutput() {
    ifstream errFile;
    stringstream buffer;

    if (!errorFile.length())
        return "";

    errFile.open(errorFile);
    if (!errFile.is_open())
        return "";

    buffer << errFile.rdbuf();
    errFile.close();

    return trimSpace(commafy(buffer.str()));
}


int PipeExec::closeWrite() {
    int result = 0;

    if (writeFd >= 0) {
        result = close(writeFd);
        writeFd = -1;
    }

    return result;
}


int PipeExec::closeRead() {
    int result = 0;

    if (readFd >= 0) {
        result = close(readFd);
        readFd = -1;
    }

    return result;
}


void PipeExec::closeAll() {
    closeWrite();
    closeRead();
}

