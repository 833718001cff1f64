#include <QtTest/QtTest>
#include <QTemporaryFile>

#include <memory>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <boost/asio.hpp>

#include "utils/console_reader.hpp"
#include "helpers/event_recorder.hpp"

using namespace peerlink;
using namespace peerlink::test;

namespace {

// Both ends of a pipe, closed on destruction
struct Pipe {
    Pipe() {
        if (::pipe(fds) != 0) {
            fds[0] = fds[1] = -1;
        }
    }
    ~Pipe() {
        closeWriteEnd();
        if (fds[0] >= 0) {
            ::close(fds[0]);
        }
    }

    bool valid() const { return fds[0] >= 0 && fds[1] >= 0; }

    bool write(const std::string& data) {
        return ::write(fds[1], data.data(), data.size()) == static_cast<ssize_t>(data.size());
    }

    void closeWriteEnd() {
        if (fds[1] >= 0) {
            ::close(fds[1]);
            fds[1] = -1;
        }
    }

    int fds[2] = {-1, -1};
};

} // namespace

class ConsoleReaderTests : public QObject {
    Q_OBJECT

private slots:
    void readsLinesUntilEof();
    void stopSuppressesCallbacks();
    void destroyedWithReadPending();
    void rejectsRegularFile();
};

void ConsoleReaderTests::readsLinesUntilEof() {
    Pipe pipe;
    QVERIFY(pipe.valid());
    QVERIFY(pipe.write("hello\r\nsecond\n\nlast"));
    pipe.closeWriteEnd();

    boost::asio::io_context ioc;
    std::vector<std::string> lines;
    int eof_count = 0;
    ConsoleReader reader(ioc, pipe.fds[0],
        [&lines](const std::string& line) { lines.push_back(line); },
        [&eof_count]() { ++eof_count; });
    reader.start();

    QVERIFY(runUntil(ioc, [&]() { return eof_count > 0; }));
    drain(ioc);
    const std::vector<std::string> expected = {"hello", "second", "", "last"};
    QVERIFY(lines == expected);
    QCOMPARE(eof_count, 1);
}

void ConsoleReaderTests::stopSuppressesCallbacks() {
    Pipe pipe;
    QVERIFY(pipe.valid());

    boost::asio::io_context ioc;
    std::vector<std::string> lines;
    int eof_count = 0;
    ConsoleReader reader(ioc, pipe.fds[0],
        [&lines, &reader](const std::string& line) {
            lines.push_back(line);
            if (line == "/quit") {
                reader.stop();
            }
        },
        [&eof_count]() { ++eof_count; });
    reader.start();

    QVERIFY(pipe.write("one\n/quit\n"));
    QVERIFY(runUntil(ioc, [&]() { return lines.size() == 2; }));

    QVERIFY(pipe.write("after stop\n"));
    pipe.closeWriteEnd();
    drain(ioc);
    QCOMPARE(lines.size(), static_cast<size_t>(2));
    QCOMPARE(eof_count, 0);
}

void ConsoleReaderTests::destroyedWithReadPending() {
    Pipe pipe;
    QVERIFY(pipe.valid());

    boost::asio::io_context ioc;
    int calls = 0;
    {
        ConsoleReader reader(ioc, pipe.fds[0],
            [&calls](const std::string&) { ++calls; },
            [&calls]() { ++calls; });
        reader.start();
        drain(ioc);
    }

    // The caller's descriptor stays usable and nothing reaches the old callbacks
    QVERIFY(pipe.write("late line\n"));
    pipe.closeWriteEnd();
    drain(ioc);
    QCOMPARE(calls, 0);

    char buffer[16] = {};
    QCOMPARE(static_cast<int>(::read(pipe.fds[0], buffer, sizeof(buffer))), 10);
}

void ConsoleReaderTests::rejectsRegularFile() {
    QTemporaryFile file;
    QVERIFY(file.open());
    const int fd = ::open(file.fileName().toLocal8Bit().constData(), O_RDONLY);
    QVERIFY(fd >= 0);

    boost::asio::io_context ioc;
    QVERIFY_EXCEPTION_THROWN(ConsoleReader(ioc, fd, [](const std::string&) {}, []() {}),
                             std::runtime_error);
    ::close(fd);
}

QTEST_MAIN(ConsoleReaderTests)
#include "test_console_reader.moc"
