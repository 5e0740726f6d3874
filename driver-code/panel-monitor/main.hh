#pragma once
#include <PanelConfig.hh>
#include <PanelContext.hh>
#include <csignal>
#include <memory>

void usage(const char* prog);
sigset_t block_stop_signals();
void subscribe(PanelDriver::PanelContext& ctx, bool clear_on_arrival);
void announce(PanelDriver::PanelContext& ctx, PanelDriver::DeviceAddress addr, bool clear_on_arrival);
