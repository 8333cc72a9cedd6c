#include <core/transfer/transfer_options.h>
#include <core/util/config.h>

namespace fileferry::core {

TransferOptions TransferOptions::FromConfigSettings() {
    return TransferOptions{
        .min_sample_interval = settings.min_sample_interval,
        .notify_interval = settings.notify_interval,
        .speed_window = settings.speed_window,
        .progress_bar_width = settings.progress_bar_width,
        .max_file_size = settings.max_file_size,
    };
}

} // namespace fileferry::core
