#pragma once

#include <QTest>
#include <QList>
#include <QString>
#include <QSharedPointer>
#include <QStandardPaths>
#include <QCoreApplication>

#include "qoutstream.h"
#include "qoptargparse.h"
#include "app.h"
#include "helper_for_test.h"
#include "logger.h"
#include "util.h"


namespace AutoTest
{

typedef QList<QObject*> TestList;

inline TestList& testList()
{
    static TestList list;
    return list;
}

inline bool findObject(QObject* object)
{
    TestList& list = testList();
    if (list.contains(object))
    {
        return true;
    }
    foreach (QObject* test, list)
    {
        if (test->objectName() == object->objectName())
        {
            return true;
        }
    }
    return false;
}

inline void addTest(QObject* object)
{
    TestList& list = testList();
    if (!findObject(object))
    {
        list.append(object);
    }
}

inline int run(int argc, char *argv[])
{
    QCoreApplication qapp(argc, argv);
    logger::setup("wbmstore-test");
    logger::setVerbosityLevel(QtMsgType::QtWarningMsg);

    // ignore first arg (command to this app)
    --argc;
    ++argv;

    QOptArgParse parser;
    QOptArg argVerbosity("", "verbosity", qtr("How much shall be printed to stderr. Note that "
                                              "dbg-messages are lost in Release-mode."));
    argVerbosity.setAllowedOptions(app::verbosities());
    parser.addArg(&argVerbosity);

    parser.parse(argc, argv);

    if(argVerbosity.wasParsed()){
        logger::setVerbosityLevel(argVerbosity.getOption());
    }

    QCoreApplication::setApplicationName(QString(app::WBMD) + "-test");
    QCoreApplication::setApplicationVersion( app::version().toString());

    QStandardPaths::setTestModeEnabled(true);
    // delete remaining paths from last test (if any)
    testhelper::deletePaths();

    int ret = 0;

    foreach (QObject* test, testList())
    {
        ret += QTest::qExec(test, {});
    }
    if(ret != 0){
        QErr() << "\n**** AT LEAST ONE TEST FAILED! ****\n\n";
    }

    return ret;
}
}

template <class T>
class Test
{
public:
    QSharedPointer<T> child;

    Test(const QString& name) : child(new T)
    {
        child->setObjectName(name);
        AutoTest::addTest(child.data());
    }
};

#define DECLARE_TEST(className) static Test<className> t(#className);

#define TEST_MAIN \
    int main(int argc, char *argv[]) \
{ \
    return AutoTest::run(argc, argv); \
    }

