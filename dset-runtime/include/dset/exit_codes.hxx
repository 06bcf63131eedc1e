#pragma once

namespace dset {

enum ExitCode {
    SUCCESS = 0,
    USAGE_ERROR = 64,
};

}
