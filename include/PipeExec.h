#ifndef PIPE_EXEC_H
#define PIPE_EXEC_H

#include <string>
#include <vector>
#include <sys/types.h>

/****************************************************************
 * PipeExec
 *
 * Execute a child process from an argument vector (no shell is
 * involved, so passphrases and paths never need quoting) with the
 * ability to write data (stdin) to it and read data back out
 * (stdout).  STDERR is redirected to a file under TMP_OUTPUT_DIR
 * so it can be included in error messages.
 *
 * Examples:
 *
 * PipeExec p({"rclone", "lsf", "remote:backups"});
 * string listing;
 * if (p.capture(listing))
 *     cerr << p.errorOutput() << endl;
 *
 * PipeExec p({"tar", "-tzf", "-"});
 * p.execute(true, poDiscard);
 * p.writeProc(buf, bytes);
 * p.closeWrite();
 * int status = p.wait();
 *
 */

using namespace std;

enum pipeOutput { poCapture, poDiscard, poInherit };


class PipeExec {
    vector<string> args;
    string procName;
    pid_t childPID;
    int writeFd;
    int readFd;
    string errorFile;
    bool reaped;
    int exitStatus;

    public:
        PipeExec(vector<string> command, string name = "");
        ~PipeExec();

        /* execute(withInput, output)
         * Fork and exec the command. With withInput the child's STDIN is a pipe fed by writeProc(),
         * otherwise it's /dev/null. The child's STDOUT is either captured (readProc()), thrown away,
         * or left attached to ours. Throws VBException if the fork itself fails; a command that can't
         * be exec'd shows up as exit status 127 from wait().
         */
        pid_t execute(bool withInput = false, pipeOutput output = poCapture);

        // execute, read all of STDOUT into output and wait; returns the exit status
        int capture(string &output);

        ssize_t readProc(void *buf, size_t count);
        string readAll();
        ssize_t writeProc(const void *buf, size_t count);
        ssize_t writeProc(const string &data);

        int wait();
        string errorOutput();
        string commandLine();

        int closeWrite();
        int closeRead();
        void closeAll();
};


#endif

