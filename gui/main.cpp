#include <QApplication>
#include "mainwindow.hpp"
#include "voxelizeworker.hpp"
#include "grid_session.hpp"
#include "grid_cache.hpp"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("voxgrid Viewer");

    voxgrid::GridSession session;
    voxgrid::GridCache cache;
    MainWindow window;

    QObject::connect(&window, &MainWindow::voxelizeRequested,
        [&window, &session, &cache](const QString& inputPath, double voxelSize, bool hasHeader) {

            VoxelizeRequest request;
            request.input_path = inputPath.toStdString();
            request.has_header = hasHeader;
            request.voxel_size = voxelSize;

            // Supersedes any voxelization still running
            uint64_t generation = session.begin_request();
            auto* worker = new VoxelizeWorker(request, generation, session, cache, &window);

            QObject::connect(worker, &VoxelizeWorker::progressChanged,
                           &window, [&session, &window, generation](int percent) {
                               if (session.is_current(generation)) {
                                   window.onProgressChanged(percent);
                               }
                           });
            QObject::connect(worker, &VoxelizeWorker::logMessage,
                           &window, &MainWindow::onLogMessage);

            QObject::connect(worker, &VoxelizeWorker::voxelized,
                           &window, [worker, &session, &window](bool success, const QString& error) {
                               if (worker->wasCancelled()) {
                                   window.onLogMessage(QString("Request %1 superseded").arg(worker->generation()));
                               } else if (success) {
                                   if (session.publish(worker->result())) {
                                       window.setResult(session.current());
                                   } else {
                                       window.onLogMessage(QString("Discarded stale result %1").arg(worker->generation()));
                                   }
                               }
                               if (session.is_current(worker->generation())) {
                                   window.onVoxelizeFinished(success, error);
                               }

                               // Clean up worker when done - wait for thread to finish first
                               worker->wait();
                               worker->deleteLater();
                           });

            worker->start();
        });

    window.show();
    int rc = app.exec();

    // Cancel in-flight work before the session goes away
    session.begin_request();
    for (auto* worker : window.findChildren<VoxelizeWorker*>()) {
        worker->wait();
    }
    return rc;
}
