// SPDX-FileCopyrightText: Arealloc authors
//
// SPDX-License-Identifier: AGPL-3.0-or-later

#ifndef AREALLOC_PROGRESSOUTPUT_H
#define AREALLOC_PROGRESSOUTPUT_H

#include "output/Output.h"
#include "progressbar.h"

namespace arealloc {

class ProgressOutput final : public Output {
  private:
    progressbar::ProgressBar bar;

  public:
    explicit ProgressOutput(const AllocationRun* run);
    void iterate(const PassResult& pass) override;
    void end() override;
};

}  // namespace arealloc

#endif
