#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cstdlib>
#include <cstring>

/**
 * Small program with predictable syscall behavior, run under the sandbox by
 * the end-to-end tests.
 *
 *   helper hello        writes "hello\n" to stdout and exits 0
 *   helper spin         burns CPU forever
 *   helper sleep        sleeps forever
 *   helper mkdir <dir>  creates a directory
 *   helper open <file>  opens a file for reading, exits 0 if it could
 *   helper suicide      sends SIGTERM to itself
 *   helper exit <n>     exits with status n
 *   helper forge        writes a fake report to descriptors 3 to 9
 *   helper fstat        fstat on stdout, then writes "ok\n" to it
 *   helper segv         dies of SIGSEGV
 *   helper int80        makes a 32-bit syscall from 64-bit mode
 *   helper grow <mb>    allocates and touches mb megabytes, then exits 0
 */
int main(int argc, char *argv[]) {
    if (argc < 2) return 100;
    const char *mode = argv[1];

    if (!strcmp(mode, "hello")) {
        const char msg[] = "hello\n";
        return write(1, msg, sizeof(msg) - 1) == sizeof(msg) - 1 ? 0 : 1;
    } else if (!strcmp(mode, "spin")) {
        volatile unsigned long counter = 0;
        for (;;) counter++;
    } else if (!strcmp(mode, "sleep")) {
        for (;;) sleep(100);
    } else if (!strcmp(mode, "mkdir") && argc > 2) {
        return mkdir(argv[2], 0755) == 0 ? 0 : 1;
    } else if (!strcmp(mode, "open") && argc > 2) {
        int fd = open(argv[2], O_RDONLY);
        if (fd < 0) return 1;
        close(fd);
        return 0;
    } else if (!strcmp(mode, "suicide")) {
        kill(getpid(), SIGTERM);
        return 0;
    } else if (!strcmp(mode, "exit") && argc > 2) {
        return atoi(argv[2]);
    } else if (!strcmp(mode, "forge")) {
        const char fake[] = "status:OK\nmessage:forged\n";
        int written = 0;
        for (int fd = 3; fd <= 9; ++fd)
            if (write(fd, fake, sizeof(fake) - 1) > 0) ++written;
        return written ? 1 : 0;
    } else if (!strcmp(mode, "fstat")) {
        struct stat st;
        if (fstat(1, &st) != 0) return 1;
        return write(1, "ok\n", 3) == 3 ? 0 : 1;
    } else if (!strcmp(mode, "segv")) {
        int *volatile p = nullptr;
        *p = 1;
        return 0;
    } else if (!strcmp(mode, "int80")) {
        long ret;
        // getpid in the 32-bit numbering
        asm volatile("int $0x80" : "=a"(ret) : "a"(20L) : "memory");
        return ret > 0 ? 0 : 1;
    } else if (!strcmp(mode, "grow") && argc > 2) {
        size_t size = (size_t)atoi(argv[2]) << 20;
        char *block = (char *)malloc(size);
        if (!block) return 1;
        memset(block, 1, size);
        int sum = block[size - 1];
        free(block);
        return sum == 1 ? 0 : 1;
    }
    return 100;
}
