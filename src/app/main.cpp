// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "appcontroller.h"
#include "../core/logging.h"
#include "../core/platform.h"
#include <QApplication>
#include <QCommandLineParser>
#include <KAboutData>
#include <KDBusService>
#include <KLocalizedString>
#include <QSocketNotifier>
#include <memory>
#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

using namespace TabNest;

int main(int argc, char* argv[])
{
    const bool forcedXcb = Platform::preferXcbPlatform();

    // Termination requests arrive on a signalfd and quit the event loop, so
    // embedded windows are restored by the normal stop() below. Blocked
    // before any thread starts so every thread inherits the mask.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGHUP);
    sigprocmask(SIG_BLOCK, &mask, nullptr);
    const int signalFd = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);

    QApplication app(argc, argv);

    if (forcedXcb) {
        qCInfo(lcApp) << "Wayland session, running under XWayland";
    }

    // Set translation domain BEFORE any i18n() calls
    KLocalizedString::setApplicationDomain("tabnest");

    KAboutData aboutData(QStringLiteral("tabnest"), i18n("TabNest"), QStringLiteral("1.0.0"),
                         i18n("Gathers application windows into tabs of one container window"),
                         KAboutLicense::GPL_V3, i18n("© 2026 fuddlesworth"));
    aboutData.addAuthor(i18n("fuddlesworth"));
    aboutData.setOrganizationDomain(QByteArrayLiteral("tabnest.org"));
    aboutData.setDesktopFileName(QStringLiteral("org.tabnest.tabnest"));

    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    QCommandLineOption replaceOption(QStringList{QStringLiteral("r"), QStringLiteral("replace")},
                                     i18n("Replace the running instance"));
    parser.addOption(replaceOption);

    parser.process(app);
    aboutData.processCommandLine(&parser);

    // Ensure single instance
    KDBusService::StartupOptions options = KDBusService::Unique;
    if (parser.isSet(replaceOption)) {
        options |= KDBusService::Replace;
    }

    KDBusService service(options);

    std::unique_ptr<QSocketNotifier> signalNotifier;
    if (signalFd >= 0) {
        signalNotifier = std::make_unique<QSocketNotifier>(signalFd, QSocketNotifier::Read);
        QObject::connect(signalNotifier.get(), &QSocketNotifier::activated, &app, [signalFd]() {
            signalfd_siginfo info;
            if (::read(signalFd, &info, sizeof(info)) == sizeof(info)) {
                qCInfo(lcApp) << "Received signal" << info.ssi_signo << "- shutting down";
            }
            QCoreApplication::quit();
        });
    } else {
        qCWarning(lcApp) << "signalfd failed, termination signals will not restore windows";
        sigprocmask(SIG_UNBLOCK, &mask, nullptr);
    }

    AppController controller;

    if (!controller.init()) {
        qCCritical(lcApp) << "Failed to initialize";
        return 1;
    }

    controller.start();
    qCInfo(lcApp) << "Started successfully";

    // A second launch activates this instance instead of starting another one
    QObject::connect(&service, &KDBusService::activateRequested, &controller, &AppController::activate);

    const int result = app.exec();

    controller.stop();
    signalNotifier.reset();
    if (signalFd >= 0) {
        ::close(signalFd);
    }

    return result;
}
