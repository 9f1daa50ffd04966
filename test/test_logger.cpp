#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTest>

#include "autotest.h"
#include "exccommon.h"
#include "helper_for_test.h"
#include "logger.h"


class LoggerTest : public QObject {
    Q_OBJECT

private slots:
    void tVerbosity() {
        logger::setVerbosityLevel(QString("critical"));
        logger::setVerbosityLevel(QString("dbg"));
        QVERIFY_EXCEPTION_THROWN(logger::setVerbosityLevel(QString("loud")),
                                 QExcIllegalArgument);
        logger::setVerbosityLevel(QtMsgType::QtWarningMsg);
    }

    void tLogToFileRotates() {
        const QString name = "rotate-test";
        const QString path = logger::logDir() + "/log_" + name;
        QVERIFY(QDir().mkpath(logger::logDir()));
        testhelper::writeStringToFile(path, QString(int(logger::MAX_LOGFILE_SIZE) + 1, 'x'));

        logger::setVerbosityLevel(QtMsgType::QtCriticalMsg);
        logger::enableLogToFile(name);
        logWarning << "message for the logfile";
        logger::setVerbosityLevel(QtMsgType::QtWarningMsg);

        QVERIFY(QFileInfo(path + "_old").size() > logger::MAX_LOGFILE_SIZE);
        const QString content = testhelper::readStringFromFile(path);
        QVERIFY(content.size() < logger::MAX_LOGFILE_SIZE);
        QVERIFY(content.contains("warning"));
        QVERIFY(content.contains("message for the logfile"));
    }
};

DECLARE_TEST(LoggerTest)

#include "test_logger.moc"
